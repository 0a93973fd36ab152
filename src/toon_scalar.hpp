#ifndef TOONPP_SCALAR_HPP
#define TOONPP_SCALAR_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include "toon_value.hpp"

namespace toonpp {

// Lexical class of a single token. QUOTED covers every token that starts
// with a double quote; the others follow the bare-token rules.
enum class ScalarKind {
    NULL_LITERAL,
    BOOL,
    INT,
    FLOAT,
    STRING,
    QUOTED
};

// Whitespace helpers
std::string_view trim(std::string_view sv);
std::string_view trim_trailing(std::string_view sv);

// Bare-token patterns: -?(0|[1-9][0-9]*) and -?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?
bool matches_int_pattern(std::string_view text);
bool matches_float_pattern(std::string_view text);

std::optional<int64_t> parse_int(std::string_view text);
std::optional<double> parse_float(std::string_view text);

// Classify a trimmed token. An integer literal outside the int64 range
// classifies as FLOAT.
ScalarKind classify_token(std::string_view token);

// Decode a quoted token, reversing the escapes. Throws SyntaxError on an
// unterminated quote, trailing characters, or (strict) an unknown escape.
std::string unquote(std::string_view token, bool strict = true, size_t line_no = 0);

// Decode any scalar token into a Value
ValuePtr parse_scalar(std::string_view token, bool strict = true, size_t line_no = 0);

// Encoding side
bool needs_quotes(std::string_view s);
std::string quote(std::string_view s);
std::string format_string(std::string_view s);
bool is_bare_key(std::string_view key);
std::string format_key(std::string_view key);
std::string format_float(double value);
std::string format_scalar(const Value& value);

// Quote-aware scanning
size_t find_closing_quote(std::string_view text, size_t open);
size_t find_unquoted(std::string_view text, char target, size_t from = 0);
std::vector<std::string_view> split_delimited(std::string_view line, char delimiter,
                                              size_t line_no = 0);

} // namespace toonpp

#endif // TOONPP_SCALAR_HPP
