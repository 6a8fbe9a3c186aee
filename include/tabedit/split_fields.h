#ifndef TABEDIT_SPLIT_FIELDS_H
#define TABEDIT_SPLIT_FIELDS_H

#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

/// Split one logical line into decoded fields.
///
/// Two-state machine. Unquoted: the quote character enters the quoted state
/// and is dropped; the delimiter (matched literally, any length) ends the
/// field. Quoted: a doubled quote yields one literal quote, a lone quote
/// returns to the unquoted state, everything else (delimiter and newline
/// included) is field content. The last field is always emitted, so a line
/// without delimiters gives one field and a trailing delimiter gives a
/// trailing empty field.
///
/// Fields are returned untrimmed.
std::vector<std::string> split_fields(std::string_view line, std::string_view delimiter,
                                      char quote_char);

} // namespace tabedit

#endif // TABEDIT_SPLIT_FIELDS_H
