/**
 * @file table_parser.h
 * @brief Parse delimited text back into a table, collecting row-level errors.
 *
 * The document is split into logical lines (quoted newlines stay inside their
 * field), then each line is classified:
 * - comment: starts with the comment prefix after leading whitespace
 * - blank: only whitespace
 * - header: the first line that is neither; it fixes the column count
 * - separator: a line after the header whose fields are all empty or dashes
 * - data: everything else
 *
 * Comments and blanks are skipped anywhere. A data line with the wrong field
 * count is reported and skipped; parsing continues with the next line. Only a
 * missing header fails the whole document.
 *
 * @example
 * @code
 * tabedit::ParseOptions options;
 * options.dialect = tabedit::Dialect::csv();
 *
 * auto result = tabedit::parse_table("a,b\n1,\"x, y\"\n", options);
 * if (!result.ok()) {
 *     std::cerr << result.errors.summary();
 * }
 * @endcode
 */

#ifndef TABEDIT_TABLE_PARSER_H
#define TABEDIT_TABLE_PARSER_H

#include "tabedit/dialect.h"
#include "tabedit/error.h"
#include "tabedit/table.h"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

/// Receives soft diagnostics that do not count as parse errors.
using WarningCallback = std::function<void(const std::string&)>;

/**
 * @brief Options for parse_table().
 */
struct ParseOptions {
  Dialect dialect;

  /// Called for recoverable oddities, e.g. input ending inside a quoted field.
  /// May be empty.
  WarningCallback warning_callback;
};

/**
 * @brief Parsed columns and rows plus the errors met along the way.
 *
 * Rows hold trimmed string values keyed by column name. Errors are in
 * document order.
 */
struct ParseResult {
  std::vector<std::string> columns;
  std::vector<Row> rows;
  ErrorCollector errors;

  bool ok() const { return !errors.has_errors(); }

  Table table() const { return Table{columns, rows}; }
};

/// Parse a delimited-text document held in memory.
ParseResult parse_table(std::string_view text, const ParseOptions& options = {});

/**
 * @brief Read and parse a file.
 *
 * A leading UTF-8 byte order mark is dropped before parsing.
 *
 * @throws std::runtime_error if the file cannot be read.
 */
ParseResult parse_table_file(const std::string& path, const ParseOptions& options = {});

} // namespace tabedit

#endif // TABEDIT_TABLE_PARSER_H
