#include "tabedit/table_parser.h"

#include "tabedit/comment_util.h"
#include "tabedit/io_util.h"
#include "tabedit/split_fields.h"
#include "tabedit/split_lines.h"

#include <algorithm>

namespace tabedit {

namespace {

bool is_skippable(std::string_view line, const std::string& comment) {
  return is_blank_line(line) || is_comment_line(line, comment);
}

// A header separator: every field trimmed is empty or made only of dashes
bool is_separator_row(const std::vector<std::string>& fields) {
  return std::all_of(fields.begin(), fields.end(), [](const std::string& f) {
    std::string_view t = trim(f);
    return std::all_of(t.begin(), t.end(), [](char c) { return c == '-'; });
  });
}

} // namespace

ParseResult parse_table(std::string_view text, const ParseOptions& options) {
  const Dialect& dialect = options.dialect;
  ParseResult result;

  bool unterminated_quote = false;
  std::vector<std::string> lines = split_logical_lines(text, dialect.quote_char, unterminated_quote);

  if (unterminated_quote && options.warning_callback) {
    options.warning_callback("Input ends inside a quoted field; the remainder was folded into line " +
                             std::to_string(lines.size()));
  }

  // The first line that is neither a comment nor blank is the header
  size_t header_idx = lines.size();
  for (size_t i = 0; i < lines.size(); ++i) {
    if (!is_skippable(lines[i], dialect.comment_prefix)) {
      header_idx = i;
      break;
    }
  }

  if (header_idx == lines.size()) {
    result.errors.add_error(ErrorCode::NO_HEADER, ErrorSeverity::FATAL, 1, 1,
                            "No header line found (only comments or empty lines)");
    return result;
  }

  for (const auto& name : split_fields(lines[header_idx], dialect.delimiter, dialect.quote_char)) {
    result.columns.emplace_back(trim(name));
  }
  const size_t ncols = result.columns.size();

  for (size_t i = header_idx + 1; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    if (is_skippable(line, dialect.comment_prefix)) {
      continue;
    }

    const size_t line_num = i + 1;
    std::vector<std::string> fields = split_fields(line, dialect.delimiter, dialect.quote_char);
    if (fields.size() != ncols) {
      result.errors.add_error(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::ERROR, line_num, 1,
                              "Expected " + std::to_string(ncols) + " columns, got " +
                                  std::to_string(fields.size()));
      continue;
    }

    if (is_separator_row(fields)) {
      continue;
    }

    Row row;
    for (size_t c = 0; c < ncols; ++c) {
      row[result.columns[c]] = std::string(trim(fields[c]));
    }
    result.rows.push_back(std::move(row));
  }

  return result;
}

ParseResult parse_table_file(const std::string& path, const ParseOptions& options) {
  std::string content = read_file(path);
  return parse_table(strip_utf8_bom(content), options);
}

} // namespace tabedit
