#ifndef TABEDIT_ERROR_H
#define TABEDIT_ERROR_H

#include <cstddef>
#include <string>
#include <vector>

namespace tabedit {

// Error categories reported by the parser, validator and edit session
enum class ErrorCode {
    NONE = 0,

    // Document errors
    NO_HEADER,                   // Only comments or blank lines in the document

    // Row shape errors
    INCONSISTENT_FIELD_COUNT,    // Row has different number of fields than header

    // Validation errors
    MISSING_REQUIRED_COLUMN,     // Required column absent from the header
    DUPLICATE_KEY,               // Key tuple repeated across rows
    TYPE_COERCION,               // Value does not parse as the declared column type

    // Configuration errors
    INVALID_CONFIGURATION        // Return mode requested without its inputs
};

// Error severity levels
enum class ErrorSeverity {
    WARNING,    // Non-fatal, informational
    ERROR,      // Recoverable error (e.g., inconsistent field count - row skipped)
    FATAL       // Unrecoverable for the call (e.g., no header line)
};

// Detailed error information
//
// An error is either positional (column_name empty, column is a 1-based index)
// or column-scoped (column_name holds the column it refers to). Line 0 marks a
// whole-document error.
struct ParseError {
    ErrorCode code;
    ErrorSeverity severity;

    size_t line;              // Logical line number (1-indexed, 0 = document)
    size_t column;            // Column number (1-indexed)
    std::string column_name;  // Set for column-scoped errors

    std::string message;      // Human-readable error message

    ParseError(ErrorCode c, ErrorSeverity s, size_t l, size_t col, const std::string& msg)
        : code(c), severity(s), line(l), column(col), message(msg) {}

    ParseError(ErrorCode c, ErrorSeverity s, size_t l, const std::string& col_name,
               const std::string& msg)
        : code(c), severity(s), line(l), column(0), column_name(col_name), message(msg) {}

    bool is_column_scoped() const { return !column_name.empty(); }

    bool operator==(const ParseError& other) const {
        return code == other.code && severity == other.severity && line == other.line &&
               column == other.column && column_name == other.column_name &&
               message == other.message;
    }

    bool operator!=(const ParseError& other) const { return !(*this == other); }

    // Convert error to string
    std::string to_string() const;
};

// Error collector - accumulates errors in document order
class ErrorCollector {
public:
    ErrorCollector() : has_fatal_(false) {}

    // Add an error
    void add_error(const ParseError& error) {
        errors_.push_back(error);
        if (error.severity == ErrorSeverity::FATAL) {
            has_fatal_ = true;
        }
    }

    // Convenience methods
    void add_error(ErrorCode code, ErrorSeverity severity, size_t line, size_t column,
                   const std::string& message) {
        add_error(ParseError(code, severity, line, column, message));
    }

    void add_error(ErrorCode code, ErrorSeverity severity, size_t line,
                   const std::string& column_name, const std::string& message) {
        add_error(ParseError(code, severity, line, column_name, message));
    }

    // Query errors
    bool has_errors() const { return !errors_.empty(); }
    bool has_fatal_errors() const { return has_fatal_; }
    size_t error_count() const { return errors_.size(); }
    const std::vector<ParseError>& errors() const { return errors_; }

    // Get summary
    std::string summary() const;

private:
    std::vector<ParseError> errors_;
    bool has_fatal_;
};

// Helper functions
const char* error_code_to_string(ErrorCode code);
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace tabedit

#endif // TABEDIT_ERROR_H
