#ifndef TABEDIT_COMMENT_UTIL_H
#define TABEDIT_COMMENT_UTIL_H

#include <string>
#include <string_view>

namespace tabedit {

inline bool is_space_char(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

/// Strip leading whitespace.
inline std::string_view ltrim(std::string_view s) {
  size_t start = 0;
  while (start < s.size() && is_space_char(s[start])) {
    ++start;
  }
  return s.substr(start);
}

/// Strip leading and trailing whitespace.
inline std::string_view trim(std::string_view s) {
  s = ltrim(s);
  size_t end = s.size();
  while (end > 0 && is_space_char(s[end - 1])) {
    --end;
  }
  return s.substr(0, end);
}

/// A line is blank when nothing but whitespace remains after stripping.
inline bool is_blank_line(std::string_view line) {
  return ltrim(line).empty();
}

/// A line is a comment when it starts with the (non-empty) comment prefix
/// after optional leading whitespace.
inline bool is_comment_line(std::string_view line, const std::string& comment) {
  if (comment.empty()) {
    return false;
  }
  std::string_view stripped = ltrim(line);
  return stripped.size() >= comment.size() && stripped.compare(0, comment.size(), comment) == 0;
}

} // namespace tabedit

#endif // TABEDIT_COMMENT_UTIL_H
