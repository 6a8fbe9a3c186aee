#include "tabedit/error.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace tabedit {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::NO_HEADER: return "NO_HEADER";
        case ErrorCode::INCONSISTENT_FIELD_COUNT: return "INCONSISTENT_FIELD_COUNT";
        case ErrorCode::MISSING_REQUIRED_COLUMN: return "MISSING_REQUIRED_COLUMN";
        case ErrorCode::DUPLICATE_KEY: return "DUPLICATE_KEY";
        case ErrorCode::TYPE_COERCION: return "TYPE_COERCION";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        default: return "UNKNOWN";
    }
}

const char* error_severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string ParseError::to_string() const {
    std::ostringstream ss;
    ss << "[" << error_severity_to_string(severity) << "] "
       << error_code_to_string(code) << " at line " << line << ", column ";
    if (is_column_scoped()) {
        ss << "'" << column_name << "'";
    } else {
        ss << column;
    }
    ss << ": " << message;
    return ss.str();
}

std::string ErrorCollector::summary() const {
    if (errors_.empty()) {
        return "No errors";
    }

    auto count = [this](ErrorSeverity severity) {
        return std::count_if(errors_.begin(), errors_.end(),
                             [severity](const ParseError& e) { return e.severity == severity; });
    };
    const std::pair<const char*, long> tallies[] = {
        {"Warnings", static_cast<long>(count(ErrorSeverity::WARNING))},
        {"Errors", static_cast<long>(count(ErrorSeverity::ERROR))},
        {"Fatal", static_cast<long>(count(ErrorSeverity::FATAL))},
    };

    std::ostringstream out;
    out << "Total errors: " << errors_.size() << " (";
    bool first = true;
    for (const auto& tally : tallies) {
        if (tally.second == 0) continue;
        out << (first ? "" : ", ") << tally.first << ": " << tally.second;
        first = false;
    }
    out << ")\n\nDetails:\n";
    for (const auto& err : errors_) {
        out << err.to_string() << '\n';
    }
    return out.str();
}

} // namespace tabedit
