#include "tabedit/split_fields.h"

namespace tabedit {

std::vector<std::string> split_fields(std::string_view line, std::string_view delimiter,
                                      char quote_char) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quote = false;
  const size_t n = line.size();
  const size_t dlen = delimiter.size();

  size_t i = 0;
  while (i < n) {
    char c = line[i];
    if (in_quote) {
      if (c == quote_char) {
        if (i + 1 < n && line[i + 1] == quote_char) {
          current += quote_char;
          i += 2;
          continue;
        }
        in_quote = false;
      } else {
        current += c;
      }
      ++i;
      continue;
    }

    if (c == quote_char) {
      in_quote = true;
      ++i;
    } else if (dlen > 0 && line.compare(i, dlen, delimiter) == 0) {
      fields.push_back(std::move(current));
      current.clear();
      i += dlen;
    } else {
      current += c;
      ++i;
    }
  }
  fields.push_back(std::move(current));

  return fields;
}

} // namespace tabedit
