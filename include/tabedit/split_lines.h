#ifndef TABEDIT_SPLIT_LINES_H
#define TABEDIT_SPLIT_LINES_H

#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

/// Split a document into logical lines.
///
/// Carriage returns are removed first, so CRLF is accepted as a line break.
/// A newline ends the current line only outside a quoted region; inside one it
/// is kept as field content. Quote characters (including doubled escapes) are
/// kept verbatim so split_fields() can decode them. The final buffer is always
/// emitted, so text ending in '\n' yields a trailing empty line.
///
/// An unterminated quote folds the rest of the input into the last line.
std::vector<std::string> split_logical_lines(std::string_view content, char quote_char);

/// Same as above; `unterminated_quote` is set when input ends inside a quote.
std::vector<std::string> split_logical_lines(std::string_view content, char quote_char,
                                             bool& unterminated_quote);

} // namespace tabedit

#endif // TABEDIT_SPLIT_LINES_H
