#include "tabedit/writer.h"

#include "tabedit/utf8.h"

#include <algorithm>
#include <sstream>

namespace tabedit {

namespace {

void write_comment_line(std::ostream& out, const std::string& prefix, const std::string& line) {
  out << prefix;
  if (!line.empty()) {
    out << ' ' << line;
  }
  out << '\n';
}

void write_cells(std::ostream& out, const std::vector<std::string>& cells,
                 const std::string& delimiter) {
  for (size_t i = 0; i < cells.size(); ++i) {
    if (i > 0) {
      out << delimiter;
    }
    out << cells[i];
  }
  out << '\n';
}

// True when the value holds the delimiter, or when a delimiter written after
// it would match starting inside the value (e.g. "a:" before "::")
bool collides_with_delimiter(std::string_view value, const std::string& delimiter) {
  if (delimiter.empty()) {
    return false;
  }
  std::string joined(value);
  joined += delimiter;
  return joined.find(delimiter) != value.size();
}

} // namespace

std::vector<std::string> default_footer_lines(const std::string& comment_prefix) {
  return {
      "",
      "Empty fields: leave cell empty, or use \"\" inside quoted fields.",
      "Lines starting with " + comment_prefix + " are ignored. Edit data rows above.",
  };
}

std::string escape_field(std::string_view value, const Dialect& dialect) {
  const char q = dialect.quote_char;
  bool needs_quote = collides_with_delimiter(value, dialect.delimiter) ||
                     value.find('\n') != std::string_view::npos ||
                     value.find('\r') != std::string_view::npos ||
                     value.find(q) != std::string_view::npos;
  if (!needs_quote) {
    return std::string(value);
  }

  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped += q;
  for (char c : value) {
    if (c == q) {
      escaped += q;
    }
    escaped += c;
  }
  escaped += q;
  return escaped;
}

void write_table(std::ostream& out, const Table& table, const WriteOptions& options) {
  const Dialect& dialect = options.dialect;
  const size_t ncols = table.columns.size();

  for (const auto& line : options.header_comment_lines) {
    write_comment_line(out, dialect.comment_prefix, line);
  }

  std::vector<std::string> header_cells;
  header_cells.reserve(ncols);
  for (const auto& col : table.columns) {
    header_cells.push_back(escape_field(col, dialect));
  }

  std::vector<std::vector<std::string>> row_cells;
  row_cells.reserve(table.rows.size());
  for (const auto& row : table.rows) {
    std::vector<std::string> cells;
    cells.reserve(ncols);
    for (const auto& col : table.columns) {
      cells.push_back(escape_field(cell(row, col), dialect));
    }
    row_cells.push_back(std::move(cells));
  }

  // Alignment needs a header to align against and at least one data row.
  // Padding spaces would split fields when the delimiter contains a space.
  std::vector<size_t> widths(ncols, 0);
  const bool align = options.align_columns && options.write_header && !row_cells.empty() &&
                     dialect.delimiter.find(' ') == std::string::npos;
  if (align) {
    for (size_t i = 0; i < ncols; ++i) {
      widths[i] = utf8_display_width(header_cells[i]);
      for (const auto& cells : row_cells) {
        widths[i] = std::max(widths[i], utf8_display_width(cells[i]));
      }
      header_cells[i] = pad_to_width(header_cells[i], widths[i]);
      for (auto& cells : row_cells) {
        cells[i] = pad_to_width(cells[i], widths[i]);
      }
    }
  }

  if (options.write_header) {
    write_cells(out, header_cells, dialect.delimiter);
    if (options.header_separator) {
      std::vector<std::string> sep_cells;
      sep_cells.reserve(ncols);
      for (size_t w : widths) {
        sep_cells.push_back(w > 0 ? std::string(w, '-') : std::string("-"));
      }
      write_cells(out, sep_cells, dialect.delimiter);
    }
  }

  for (const auto& cells : row_cells) {
    write_cells(out, cells, dialect.delimiter);
  }

  std::vector<std::string> footer;
  if (options.footer_comment_lines.has_value()) {
    footer = *options.footer_comment_lines;
  } else if (options.default_footer) {
    footer = default_footer_lines(dialect.comment_prefix);
  }
  for (const auto& line : footer) {
    write_comment_line(out, dialect.comment_prefix, line);
  }
}

std::string write_table(const Table& table, const WriteOptions& options) {
  std::ostringstream ss;
  write_table(ss, table, options);
  return ss.str();
}

std::string write_table(const TableSource& source, const WriteOptions& options) {
  return write_table(normalize(source), options);
}

} // namespace tabedit
