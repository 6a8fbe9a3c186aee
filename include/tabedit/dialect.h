/**
 * @file dialect.h
 * @brief Delimited-text dialect configuration.
 *
 * A dialect names the three characters (or strings) that give a document its
 * structure: the field delimiter, the quote character and the comment prefix.
 * The same dialect must be used to write a document and to parse it back.
 */

#ifndef TABEDIT_DIALECT_H
#define TABEDIT_DIALECT_H

#include <string>

namespace tabedit {

/**
 * @brief Delimited-text dialect.
 *
 * - delimiter: field separator, matched literally; may be longer than one
 *   character (default: tab)
 * - quote_char: character used to quote fields; doubled inside a quoted field
 *   to produce one literal quote (default: double-quote)
 * - comment_prefix: marks a line as a comment when it appears after optional
 *   leading whitespace (default: "#")
 */
struct Dialect {
    std::string delimiter = "\t";
    char quote_char = '"';
    std::string comment_prefix = "#";

    /// Factory for tab-separated text (the default)
    static Dialect tsv() {
        return Dialect{"\t", '"', "#"};
    }

    /// Factory for comma-separated text
    static Dialect csv() {
        return Dialect{",", '"', "#"};
    }

    /// Factory for semicolon-separated text (European style)
    static Dialect semicolon() {
        return Dialect{";", '"', "#"};
    }

    /// Factory for pipe-separated text
    static Dialect pipe() {
        return Dialect{"|", '"', "#"};
    }

    bool operator==(const Dialect& other) const {
        return delimiter == other.delimiter &&
               quote_char == other.quote_char &&
               comment_prefix == other.comment_prefix;
    }

    bool operator!=(const Dialect& other) const {
        return !(*this == other);
    }

    /// Returns a human-readable description of the dialect
    std::string to_string() const;
};

/**
 * @brief Build a dialect from a command-line delimiter name.
 *
 * Accepts "tab", "comma", "semicolon", "pipe", the escape "\t", or any
 * literal non-empty string (multi-character delimiters are allowed).
 *
 * @throws std::invalid_argument if the delimiter string is empty.
 */
Dialect dialect_from_name(const std::string& delimiter, char quote_char = '"',
                          const std::string& comment_prefix = "#");

} // namespace tabedit

#endif // TABEDIT_DIALECT_H
