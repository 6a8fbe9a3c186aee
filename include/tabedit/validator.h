/**
 * @file validator.h
 * @brief Structural and type checks over a parsed table.
 *
 * Three independent checks, each run only when its option is supplied:
 * 1. required columns are present in the header
 * 2. key columns are unique across rows
 * 3. each declared column's values coerce to the declared type
 *
 * Errors use the same ParseError record as the parser and are appended in
 * that check order. Validation never modifies the rows.
 */

#ifndef TABEDIT_VALIDATOR_H
#define TABEDIT_VALIDATOR_H

#include "tabedit/error.h"
#include "tabedit/table.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tabedit {

enum class ColumnKind {
  INTEGER,
  FLOAT,
  BOOLEAN,
  STRING,
  CUSTOM
};

/// Returns true when the value is acceptable for a custom column type.
using Coercer = std::function<bool(std::string_view)>;

/**
 * @brief Declared type of a column.
 *
 * The built-in kinds cover integers, floats (comma or period decimal
 * separator), booleans and plain strings. CUSTOM carries a caller-supplied
 * coercer and the name used in error messages.
 */
struct ColumnType {
  ColumnKind kind = ColumnKind::STRING;
  std::string name = "string";
  Coercer coerce;

  static ColumnType integer() { return {ColumnKind::INTEGER, "integer", nullptr}; }
  static ColumnType floating() { return {ColumnKind::FLOAT, "float", nullptr}; }
  static ColumnType boolean() { return {ColumnKind::BOOLEAN, "boolean", nullptr}; }
  static ColumnType string() { return {ColumnKind::STRING, "string", nullptr}; }
  /// @throws std::invalid_argument if `fn` is empty.
  static ColumnType custom(std::string type_name, Coercer fn) {
    if (!fn) {
      throw std::invalid_argument("Custom column type '" + type_name + "' needs a coercer");
    }
    return {ColumnKind::CUSTOM, std::move(type_name), std::move(fn)};
  }

  /// Whether `value` coerces to this type. Empty values are handled by the caller.
  /// A CUSTOM type without a coercer accepts nothing.
  bool accepts(std::string_view value) const;
};

/// Parse a built-in type name ("integer"/"int", "float"/"double",
/// "boolean"/"bool", "string"/"str").
/// @throws std::invalid_argument for unknown names.
ColumnType column_type_from_name(const std::string& name);

/**
 * @brief Options for validate(). Unset options skip their check.
 */
struct ValidationOptions {
  std::optional<std::vector<std::string>> required_columns;
  std::optional<std::vector<std::string>> key_columns;

  /// Declared column types, checked in declaration order.
  std::vector<std::pair<std::string, ColumnType>> column_types;

  bool empty() const {
    return !required_columns.has_value() && !key_columns.has_value() && column_types.empty();
  }
};

/// Integer parse of the whole (trimmed) value; a leading '+' is allowed.
std::optional<int64_t> parse_integer(std::string_view value);

/// Float parse of the whole (trimmed) value after replacing ',' with '.'.
std::optional<double> parse_float(std::string_view value);

/// Boolean parse, case-insensitive: true/1/yes/ja and false/0/no/nein.
std::optional<bool> parse_boolean(std::string_view value);

/// Run every configured check and return the errors found.
ErrorCollector validate(const std::vector<std::string>& columns, const std::vector<Row>& rows,
                        const ValidationOptions& options);

/// Format a key tuple for messages, e.g. "(1, alice)".
std::string format_key(const KeyTuple& key);

} // namespace tabedit

#endif // TABEDIT_VALIDATOR_H
