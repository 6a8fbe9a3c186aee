/**
 * @file writer.h
 * @brief Serialize a table to human-editable delimited text.
 *
 * Layout, top to bottom:
 * 1. header comment lines (comment prefix + space + text; an empty line is
 *    written as the bare prefix)
 * 2. header row
 * 3. separator row of dashes, one run per column
 * 4. data rows
 * 5. footer comment lines (explicit list, or the default footer, or nothing)
 *
 * Quoting is minimal and delimiter-relative: a field is quoted only when it
 * contains the delimiter, a newline, a carriage return or the quote
 * character. With a multi-character delimiter, a field whose tail is a prefix
 * of the delimiter is quoted too, so the delimiter after it is found intact. The output parses back with parse_table() under the same dialect.
 */

#ifndef TABEDIT_WRITER_H
#define TABEDIT_WRITER_H

#include "tabedit/dialect.h"
#include "tabedit/table.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

/**
 * @brief Layout options for write_table().
 */
struct WriteOptions {
  Dialect dialect;

  /// Comment lines written above the header.
  std::vector<std::string> header_comment_lines;

  /// Comment lines written below the data. When unset, the default footer is
  /// written if default_footer is true.
  std::optional<std::vector<std::string>> footer_comment_lines;

  bool default_footer = true;   ///< Explain empty-field and comment conventions
  bool write_header = true;     ///< Emit the header row
  bool header_separator = true; ///< Emit a dashed row under the header
  /// Pad cells so columns line up. Ignored when the delimiter contains a space.
  bool align_columns = true;
};

/// Footer written when no explicit footer is given and default_footer is set.
std::vector<std::string> default_footer_lines(const std::string& comment_prefix);

/// Quote and escape one field for the given dialect.
std::string escape_field(std::string_view value, const Dialect& dialect);

/// Write the table as delimited text to `out`.
void write_table(std::ostream& out, const Table& table, const WriteOptions& options = {});

/// Write the table as delimited text and return it.
std::string write_table(const Table& table, const WriteOptions& options = {});

/// Normalize any table source, then write it.
std::string write_table(const TableSource& source, const WriteOptions& options = {});

} // namespace tabedit

#endif // TABEDIT_WRITER_H
