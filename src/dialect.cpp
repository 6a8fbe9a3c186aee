#include "tabedit/dialect.h"

#include <sstream>
#include <stdexcept>

namespace tabedit {

namespace {

std::string printable(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == '\t') {
      out += "\\t";
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out += c;
    }
  }
  return out;
}

} // namespace

std::string Dialect::to_string() const {
  std::ostringstream ss;
  ss << "Dialect{delimiter='" << printable(delimiter) << "', quote='" << quote_char
     << "', comment='" << comment_prefix << "'}";
  return ss.str();
}

Dialect dialect_from_name(const std::string& delimiter, char quote_char,
                          const std::string& comment_prefix) {
  Dialect dialect;
  dialect.quote_char = quote_char;
  dialect.comment_prefix = comment_prefix;

  if (delimiter == "comma") {
    dialect.delimiter = ",";
  } else if (delimiter == "tab" || delimiter == "\\t") {
    dialect.delimiter = "\t";
  } else if (delimiter == "semicolon") {
    dialect.delimiter = ";";
  } else if (delimiter == "pipe") {
    dialect.delimiter = "|";
  } else if (!delimiter.empty()) {
    dialect.delimiter = delimiter;
  } else {
    throw std::invalid_argument("delimiter must not be empty");
  }

  return dialect;
}

} // namespace tabedit
