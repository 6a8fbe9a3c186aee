#include "tabedit/split_lines.h"

namespace tabedit {

std::vector<std::string> split_logical_lines(std::string_view content, char quote_char) {
  bool unterminated_quote = false;
  return split_logical_lines(content, quote_char, unterminated_quote);
}

std::vector<std::string> split_logical_lines(std::string_view content, char quote_char,
                                             bool& unterminated_quote) {
  // Normalize line endings: drop every \r so \r\n collapses to \n
  std::string text;
  text.reserve(content.size());
  for (char c : content) {
    if (c != '\r') {
      text += c;
    }
  }

  std::vector<std::string> lines;
  std::string current;
  bool in_quote = false;
  const size_t n = text.size();

  for (size_t i = 0; i < n; ++i) {
    char c = text[i];
    if (in_quote) {
      if (c == quote_char) {
        if (i + 1 < n && text[i + 1] == quote_char) {
          // Escaped quote: pass both through for the field tokenizer
          current += quote_char;
          current += quote_char;
          ++i;
        } else {
          current += quote_char;
          in_quote = false;
        }
      } else {
        current += c;
      }
    } else if (c == quote_char) {
      current += quote_char;
      in_quote = true;
    } else if (c == '\n') {
      lines.push_back(std::move(current));
      current.clear();
    } else {
      current += c;
    }
  }
  lines.push_back(std::move(current));

  unterminated_quote = in_quote;
  return lines;
}

} // namespace tabedit
