#include "tabedit/table.h"

#include <algorithm>

namespace tabedit {

namespace {

const std::string& empty_string() {
  static const std::string empty;
  return empty;
}

} // namespace

const std::string& cell(const Row& row, const std::string& column) {
  auto it = row.find(column);
  if (it == row.end()) {
    return empty_string();
  }
  return it->second;
}

KeyTuple key_of(const Row& row, const std::vector<std::string>& key_columns) {
  KeyTuple key;
  key.reserve(key_columns.size());
  for (const auto& col : key_columns) {
    key.push_back(cell(row, col));
  }
  return key;
}

//-----------------------------------------------------------------------------
// RowTable
//-----------------------------------------------------------------------------

std::vector<Row> RowTable::rows() const {
  // Restrict each row to the declared columns; absent cells become empty
  std::vector<Row> result;
  result.reserve(rows_.size());
  for (const auto& r : rows_) {
    Row row;
    for (const auto& col : columns_) {
      row[col] = cell(r, col);
    }
    result.push_back(std::move(row));
  }
  return result;
}

//-----------------------------------------------------------------------------
// ColumnTable
//-----------------------------------------------------------------------------

std::vector<std::string> ColumnTable::columns() const {
  std::vector<std::string> names;
  names.reserve(data_.size());
  for (const auto& col : data_) {
    names.push_back(col.first);
  }
  return names;
}

std::vector<Row> ColumnTable::rows() const {
  size_t nrows = 0;
  for (const auto& col : data_) {
    nrows = std::max(nrows, col.second.size());
  }

  std::vector<Row> result(nrows);
  for (const auto& col : data_) {
    for (size_t i = 0; i < nrows; ++i) {
      result[i][col.first] = i < col.second.size() ? col.second[i] : std::string();
    }
  }
  return result;
}

//-----------------------------------------------------------------------------
// RecordTable
//-----------------------------------------------------------------------------

std::vector<std::string> RecordTable::columns() const {
  std::vector<std::string> names;
  if (records_.empty()) {
    return names;
  }
  for (const auto& field : records_.front()) {
    names.push_back(field.first);
  }
  return names;
}

std::vector<Row> RecordTable::rows() const {
  std::vector<std::string> names = columns();
  std::vector<Row> result;
  result.reserve(records_.size());
  for (const auto& record : records_) {
    Row row;
    for (const auto& name : names) {
      row[name] = std::string();
    }
    for (const auto& field : record) {
      if (row.count(field.first) > 0) {
        row[field.first] = field.second;
      }
    }
    result.push_back(std::move(row));
  }
  return result;
}

Table normalize(const TableSource& source) {
  Table table;
  table.columns = source.columns();
  table.rows = source.rows();
  return table;
}

} // namespace tabedit
