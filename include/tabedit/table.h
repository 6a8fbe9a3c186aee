/**
 * @file table.h
 * @brief Canonical table model and adapters for table-like inputs.
 *
 * Every value at the codec layer is a string. A Row maps column names to
 * values; a Table pairs an ordered column list with an ordered row sequence.
 *
 * Duplicate column names are permitted in the column list, but a Row holds a
 * single value per name: when a document repeats a column name, the value of
 * the right-most column wins and name-based access cannot reach the others.
 */

#ifndef TABEDIT_TABLE_H
#define TABEDIT_TABLE_H

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tabedit {

/// One row: column name -> string value.
using Row = std::map<std::string, std::string>;

/// Ordered values of the key columns of one row.
using KeyTuple = std::vector<std::string>;

/**
 * @brief Canonical (columns, rows) form.
 */
struct Table {
  std::vector<std::string> columns;
  std::vector<Row> rows;

  bool operator==(const Table& other) const {
    return columns == other.columns && rows == other.rows;
  }
  bool operator!=(const Table& other) const { return !(*this == other); }
};

/**
 * @brief Look up a cell, returning an empty string when the row lacks the column.
 */
const std::string& cell(const Row& row, const std::string& column);

/**
 * @brief Extract the key tuple of a row, in key-column order.
 *
 * Columns the row does not contain contribute an empty string.
 */
KeyTuple key_of(const Row& row, const std::vector<std::string>& key_columns);

/**
 * @brief Something that yields ordered column names and an ordered row sequence.
 *
 * The adapters below cover the input shapes a caller typically has at hand.
 * Pick the adapter matching the data you hold; normalize() turns any of them
 * into a Table.
 */
class TableSource {
public:
  virtual ~TableSource() = default;

  virtual std::vector<std::string> columns() const = 0;
  virtual std::vector<Row> rows() const = 0;
};

/**
 * @brief Adapter over a (columns, rows) pair.
 */
class RowTable : public TableSource {
public:
  RowTable(std::vector<std::string> columns, std::vector<Row> rows)
      : columns_(std::move(columns)), rows_(std::move(rows)) {}

  explicit RowTable(const Table& table) : columns_(table.columns), rows_(table.rows) {}

  std::vector<std::string> columns() const override { return columns_; }
  std::vector<Row> rows() const override;

private:
  std::vector<std::string> columns_;
  std::vector<Row> rows_;
};

/**
 * @brief Adapter over column-oriented data: an ordered list of named columns.
 *
 * Shorter columns are padded with empty strings up to the longest column.
 */
class ColumnTable : public TableSource {
public:
  using Column = std::pair<std::string, std::vector<std::string>>;

  explicit ColumnTable(std::vector<Column> data) : data_(std::move(data)) {}

  std::vector<std::string> columns() const override;
  std::vector<Row> rows() const override;

private:
  std::vector<Column> data_;
};

/**
 * @brief Adapter over a sequence of records, each an ordered list of fields.
 *
 * The column set and its order come from the first record. Fields of later
 * records that are not in that set are ignored; missing ones read as empty.
 */
class RecordTable : public TableSource {
public:
  using Record = std::vector<std::pair<std::string, std::string>>;

  explicit RecordTable(std::vector<Record> records) : records_(std::move(records)) {}

  std::vector<std::string> columns() const override;
  std::vector<Row> rows() const override;

private:
  std::vector<Record> records_;
};

/// Collapse any table source into the canonical form.
Table normalize(const TableSource& source);

} // namespace tabedit

#endif // TABEDIT_TABLE_H
