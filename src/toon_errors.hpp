#ifndef TOONPP_ERRORS_HPP
#define TOONPP_ERRORS_HPP

#include <string>
#include <stdexcept>
#include <cstddef>
#include <utility>

namespace toonpp {

// Error types
enum class ErrorType {
    SYNTAX_ERROR,
    SCHEMA_MISMATCH,
    TYPE_ERROR,
    ENCODING_INVARIANT,
    ENCODING_ERROR,
    IO_ERROR
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::SYNTAX_ERROR:       return "syntax error";
        case ErrorType::SCHEMA_MISMATCH:    return "schema mismatch";
        case ErrorType::TYPE_ERROR:         return "type error";
        case ErrorType::ENCODING_INVARIANT: return "encoding invariant violated";
        case ErrorType::ENCODING_ERROR:     return "encoding error";
        case ErrorType::IO_ERROR:           return "I/O error";
    }
    return "error";
}

// Offending line text, shortened for error messages
inline std::string make_snippet(const std::string& line) {
    if (line.length() > 60) {
        return line.substr(0, 57) + "...";
    }
    return line;
}

// Base error with location information
class ToonError : public std::runtime_error {
public:
    ToonError(ErrorType type,
              const std::string& message,
              size_t line = 0,
              size_t column = 0,
              const std::string& snippet = "",
              const std::string& file = "")
        : std::runtime_error(message),
          type_(type),
          line_(line),
          column_(column),
          snippet_(snippet),
          file_(file) {}

    ErrorType type() const { return type_; }
    size_t line() const { return line_; }
    size_t column() const { return column_; }
    const std::string& snippet() const { return snippet_; }
    const std::string& file() const { return file_; }

    std::string formatted_message() const {
        std::string msg = std::string(error_type_name(type_)) + ": " + what();
        if (!file_.empty()) {
            msg += "\n  File: " + file_;
        }
        if (line_ > 0) {
            msg += "\n  Location: line " + std::to_string(line_);
            if (column_ > 0) {
                msg += ", column " + std::to_string(column_);
            }
        }
        if (!snippet_.empty()) {
            msg += "\n  Snippet: " + snippet_;
        }
        return msg;
    }

private:
    ErrorType type_;
    size_t line_;
    size_t column_;
    std::string snippet_;
    std::string file_;
};

// Unparseable line shape: malformed header, bad indentation, unterminated quote
class SyntaxError : public ToonError {
public:
    SyntaxError(const std::string& message,
                size_t line = 0,
                size_t column = 0,
                const std::string& snippet = "",
                const std::string& file = "")
        : ToonError(ErrorType::SYNTAX_ERROR, message, line, column, snippet, file) {}
};

// Declared and observed shapes disagree (array length, row width, columns)
class SchemaMismatchError : public ToonError {
public:
    SchemaMismatchError(const std::string& message,
                        size_t expected,
                        size_t actual,
                        size_t line = 0,
                        const std::string& file = "")
        : ToonError(ErrorType::SCHEMA_MISMATCH, message, line, 0, "", file),
          expected_(expected),
          actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// A table cell rejected by the converter its column was fixed to
class TypeError : public ToonError {
public:
    TypeError(const std::string& message,
              const std::string& column,
              size_t line = 0,
              const std::string& snippet = "",
              const std::string& file = "")
        : ToonError(ErrorType::TYPE_ERROR, message, line, 0, snippet, file),
          column_(column) {}

    const std::string& column() const { return column_; }

private:
    std::string column_;
};

// Raised by the encoder when a list classified as tabular fails row validation
class EncodingInvariantError : public ToonError {
public:
    explicit EncodingInvariantError(const std::string& message)
        : ToonError(ErrorType::ENCODING_INVARIANT, message) {}
};

// Outcome of validate_string / validate_file
struct ValidationResult {
    bool valid = true;
    ErrorType error_type = ErrorType::SYNTAX_ERROR;
    std::string message;
    size_t line = 0;
    size_t column = 0;
    std::string file;

    static ValidationResult ok() { return ValidationResult(); }

    static ValidationResult error(const ToonError& e) {
        ValidationResult r;
        r.valid = false;
        r.error_type = e.type();
        r.message = e.formatted_message();
        r.line = e.line();
        r.column = e.column();
        r.file = e.file();
        return r;
    }
};

// Non-fatal condition recorded during a call, e.g. "n_mismatch" or "duplicate_key"
struct Warning {
    std::string type;
    std::string message;

    Warning(std::string t, std::string m) : type(std::move(t)), message(std::move(m)) {}
};

} // namespace toonpp

#endif // TOONPP_ERRORS_HPP
