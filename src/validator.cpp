#include "tabedit/validator.h"

#include "tabedit/comment_util.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fast_float/fast_float.h>
#include <map>
#include <set>
#include <stdexcept>

namespace tabedit {

std::optional<int64_t> parse_integer(std::string_view value) {
  std::string_view v = trim(value);
  // std::from_chars rejects a leading '+'
  if (!v.empty() && v[0] == '+') {
    v.remove_prefix(1);
    if (!v.empty() && v[0] == '-') {
      return std::nullopt;
    }
  }
  if (v.empty()) {
    return std::nullopt;
  }

  int64_t result = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), result);
  if (ec != std::errc() || ptr != v.data() + v.size()) {
    return std::nullopt;
  }
  return result;
}

std::optional<double> parse_float(std::string_view value) {
  std::string v(trim(value));
  std::replace(v.begin(), v.end(), ',', '.');

  const char* start = v.data();
  const char* end = v.data() + v.size();
  // Strip leading '+' that fast_float doesn't accept
  if (start != end && *start == '+') {
    ++start;
    if (start != end && *start == '-') {
      return std::nullopt;
    }
  }
  if (start == end) {
    return std::nullopt;
  }

  double result = 0.0;
  auto [ptr, ec] = fast_float::from_chars(start, end, result);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return result;
}

std::optional<bool> parse_boolean(std::string_view value) {
  std::string v(trim(value));
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (v == "true" || v == "1" || v == "yes" || v == "ja") return true;
  if (v == "false" || v == "0" || v == "no" || v == "nein") return false;
  return std::nullopt;
}

bool ColumnType::accepts(std::string_view value) const {
  switch (kind) {
    case ColumnKind::INTEGER: return parse_integer(value).has_value();
    case ColumnKind::FLOAT: return parse_float(value).has_value();
    case ColumnKind::BOOLEAN: return parse_boolean(value).has_value();
    case ColumnKind::STRING: return true;
    case ColumnKind::CUSTOM: return coerce ? coerce(value) : false;
  }
  return false;
}

ColumnType column_type_from_name(const std::string& name) {
  if (name == "integer" || name == "int") return ColumnType::integer();
  if (name == "float" || name == "double") return ColumnType::floating();
  if (name == "boolean" || name == "bool") return ColumnType::boolean();
  if (name == "string" || name == "str") return ColumnType::string();
  throw std::invalid_argument("Unknown column type: " + name);
}

std::string format_key(const KeyTuple& key) {
  std::string out = "(";
  for (size_t i = 0; i < key.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += key[i];
  }
  out += ")";
  return out;
}

ErrorCollector validate(const std::vector<std::string>& columns, const std::vector<Row>& rows,
                        const ValidationOptions& options) {
  ErrorCollector errors;

  if (options.required_columns.has_value()) {
    std::set<std::string> present(columns.begin(), columns.end());
    for (const auto& name : *options.required_columns) {
      if (present.count(name) == 0) {
        errors.add_error(ErrorCode::MISSING_REQUIRED_COLUMN, ErrorSeverity::ERROR, 1, name,
                         "Required column missing: " + name);
      }
    }
  }

  // Row numbers are 1-based; +1 expresses the row as a line offset from the header
  if (options.key_columns.has_value() && !options.key_columns->empty()) {
    std::map<KeyTuple, size_t> seen;
    for (size_t i = 0; i < rows.size(); ++i) {
      const size_t row_num = i + 1;
      KeyTuple key = key_of(rows[i], *options.key_columns);
      auto it = seen.find(key);
      if (it != seen.end()) {
        errors.add_error(ErrorCode::DUPLICATE_KEY, ErrorSeverity::ERROR, row_num + 1, 1,
                         "Duplicate key " + format_key(key) + " (first at row " +
                             std::to_string(it->second + 1) + ")");
      } else {
        seen.emplace(std::move(key), row_num);
      }
    }
  }

  for (const auto& decl : options.column_types) {
    const std::string& col = decl.first;
    const ColumnType& type = decl.second;
    for (size_t i = 0; i < rows.size(); ++i) {
      const std::string& value = cell(rows[i], col);
      // Empty means missing for every type but plain strings
      if (value.empty() && type.kind != ColumnKind::STRING) {
        continue;
      }
      if (!type.accepts(value)) {
        errors.add_error(ErrorCode::TYPE_COERCION, ErrorSeverity::ERROR, i + 2, col,
                         "Could not parse \"" + value + "\" as " + type.name);
      }
    }
  }

  return errors;
}

} // namespace tabedit
