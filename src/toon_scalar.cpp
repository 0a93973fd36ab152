#include "toon_scalar.hpp"
#include "toon_charconv.h"
#include "toon_errors.hpp"
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace toonpp {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Consume one or more digits starting at pos
bool consume_digits(std::string_view text, size_t& pos) {
    size_t start = pos;
    while (pos < text.size() && is_digit(text[pos])) {
        pos++;
    }
    return pos > start;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool parse_hex4(std::string_view text, size_t pos, uint32_t& cp) {
    if (pos + 4 > text.size()) return false;
    auto res = std::from_chars(text.data() + pos, text.data() + pos + 4, cp, 16);
    return res.ec == std::errc{} && res.ptr == text.data() + pos + 4;
}

} // namespace

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

std::string_view trim_trailing(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

bool matches_int_pattern(std::string_view text) {
    size_t pos = 0;
    if (pos < text.size() && text[pos] == '-') pos++;
    if (pos >= text.size()) return false;

    // No leading zero except the value 0 itself
    if (text[pos] == '0') {
        return pos + 1 == text.size();
    }
    return consume_digits(text, pos) && pos == text.size();
}

bool matches_float_pattern(std::string_view text) {
    size_t pos = 0;
    if (pos < text.size() && text[pos] == '-') pos++;
    if (!consume_digits(text, pos)) return false;
    if (pos >= text.size() || text[pos] != '.') return false;
    pos++;
    if (!consume_digits(text, pos)) return false;
    if (pos == text.size()) return true;

    if (text[pos] != 'e' && text[pos] != 'E') return false;
    pos++;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) pos++;
    return consume_digits(text, pos) && pos == text.size();
}

std::optional<int64_t> parse_int(std::string_view text) {
    if (!matches_int_pattern(text)) return std::nullopt;

    int64_t value;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec == std::errc{} && result.ptr == text.data() + text.size()) {
        return value;
    }
    return std::nullopt;
}

std::optional<double> parse_float(std::string_view text) {
    if (text.empty()) return std::nullopt;

    double value;
    auto result = double_from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec == std::errc{} && result.ptr == text.data() + text.size() &&
        std::isfinite(value)) {
        return value;
    }
    return std::nullopt;
}

ScalarKind classify_token(std::string_view token) {
    if (!token.empty() && token.front() == '"') return ScalarKind::QUOTED;
    if (token == "null") return ScalarKind::NULL_LITERAL;
    if (token == "true" || token == "false") return ScalarKind::BOOL;

    if (matches_int_pattern(token)) {
        if (parse_int(token)) return ScalarKind::INT;
        // Integer literal too wide for int64
        if (parse_float(token)) return ScalarKind::FLOAT;
        return ScalarKind::STRING;
    }
    if (matches_float_pattern(token) && parse_float(token)) {
        return ScalarKind::FLOAT;
    }
    return ScalarKind::STRING;
}

size_t find_closing_quote(std::string_view text, size_t open) {
    for (size_t i = open + 1; i < text.size(); i++) {
        if (text[i] == '\\') {
            i++;
            continue;
        }
        if (text[i] == '"') return i;
    }
    return std::string_view::npos;
}

size_t find_unquoted(std::string_view text, char target, size_t from) {
    bool in_string = false;
    bool escape = false;

    for (size_t i = from; i < text.size(); i++) {
        char c = text[i];

        if (escape) {
            escape = false;
            continue;
        }

        if (c == '\\' && in_string) {
            escape = true;
            continue;
        }

        if (c == '"') {
            in_string = !in_string;
            continue;
        }

        if (!in_string && c == target) {
            return i;
        }
    }
    return std::string_view::npos;
}

std::vector<std::string_view> split_delimited(std::string_view line, char delimiter,
                                              size_t line_no) {
    std::vector<std::string_view> fields;

    size_t start = 0;
    bool in_string = false;
    bool escape = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];

        if (escape) {
            escape = false;
            continue;
        }

        if (c == '\\' && in_string) {
            escape = true;
            continue;
        }

        if (c == '"') {
            in_string = !in_string;
            continue;
        }

        if (!in_string && c == delimiter) {
            fields.push_back(trim(line.substr(start, i - start)));
            start = i + 1;
        }
    }

    if (in_string) {
        throw SyntaxError("Unterminated quoted value", line_no, 0,
                          make_snippet(std::string(line)));
    }

    // Last field
    fields.push_back(trim(line.substr(start)));
    return fields;
}

std::string unquote(std::string_view token, bool strict, size_t line_no) {
    token = trim(token);
    if (token.empty() || token.front() != '"') {
        throw SyntaxError("Expected a quoted string", line_no, 0,
                          make_snippet(std::string(token)));
    }

    size_t close = find_closing_quote(token, 0);
    if (close == std::string_view::npos) {
        throw SyntaxError("Unterminated quoted string", line_no, 0,
                          make_snippet(std::string(token)));
    }
    if (close != token.size() - 1) {
        throw SyntaxError("Unexpected characters after closing quote", line_no, 0,
                          make_snippet(std::string(token)));
    }

    std::string result;
    result.reserve(close);

    for (size_t i = 1; i < close; i++) {
        char c = token[i];
        if (c != '\\') {
            result += c;
            continue;
        }

        char next = token[i + 1];
        switch (next) {
            case '"':  result += '"'; i++; break;
            case '\\': result += '\\'; i++; break;
            case '/':  result += '/'; i++; break;
            case 'n':  result += '\n'; i++; break;
            case 'r':  result += '\r'; i++; break;
            case 't':  result += '\t'; i++; break;
            case 'u': {
                uint32_t cp = 0;
                if (i + 6 <= close && parse_hex4(token, i + 2, cp)) {
                    i += 5;
                    // Surrogate pair
                    uint32_t low = 0;
                    if (cp >= 0xD800 && cp <= 0xDBFF && i + 7 <= close &&
                        token[i + 1] == '\\' && token[i + 2] == 'u' &&
                        parse_hex4(token, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        i += 6;
                    } else if (cp >= 0xD800 && cp <= 0xDFFF) {
                        if (strict) {
                            throw SyntaxError("Unpaired surrogate in \\u escape", line_no, i - 4,
                                              make_snippet(std::string(token)));
                        }
                        cp = 0xFFFD;
                    }
                    append_utf8(result, cp);
                } else {
                    if (strict) {
                        throw SyntaxError("Invalid \\u escape", line_no, i + 1,
                                          make_snippet(std::string(token)));
                    }
                    result += c;
                }
                break;
            }
            default:
                if (strict) {
                    throw SyntaxError(std::string("Invalid escape sequence \\") + next,
                                      line_no, i + 1, make_snippet(std::string(token)));
                }
                result += c;
                break;
        }
    }

    return result;
}

ValuePtr parse_scalar(std::string_view token, bool strict, size_t line_no) {
    token = trim(token);

    if (token.empty()) {
        if (strict) {
            throw SyntaxError("Empty value", line_no);
        }
        return Value::make_null();
    }

    switch (classify_token(token)) {
        case ScalarKind::QUOTED:
            return Value::make_string(unquote(token, strict, line_no));
        case ScalarKind::NULL_LITERAL:
            return Value::make_null();
        case ScalarKind::BOOL:
            return Value::make_bool(token == "true");
        case ScalarKind::INT:
            return Value::make_int(*parse_int(token));
        case ScalarKind::FLOAT:
            return Value::make_float(*parse_float(token));
        case ScalarKind::STRING:
            break;
    }
    return Value::make_string(token);
}

bool needs_quotes(std::string_view s) {
    if (s.empty()) return true;

    if (std::isspace(static_cast<unsigned char>(s.front())) ||
        std::isspace(static_cast<unsigned char>(s.back()))) {
        return true;
    }

    for (char c : s) {
        switch (c) {
            case ',': case ':': case '{': case '}': case '[': case ']':
            case '"': case '\\': case '#':
                return true;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                    return true;
                }
                break;
        }
    }

    // Comment marker, list marker
    if (s.find("//") != std::string_view::npos) return true;
    if (s == "-" || (s.size() >= 2 && s[0] == '-' && s[1] == ' ')) return true;

    // Would decode as another type
    return classify_token(s) != ScalarKind::STRING;
}

std::string quote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control character - encode as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out.append(buf, 6);
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
    return out;
}

std::string format_string(std::string_view s) {
    if (needs_quotes(s)) return quote(s);
    return std::string(s);
}

bool is_bare_key(std::string_view key) {
    if (key.empty()) return false;
    char first = key.front();
    if (!(std::isalpha(static_cast<unsigned char>(first)) || first == '_')) {
        return false;
    }
    for (char c : key) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.')) {
            return false;
        }
    }
    return true;
}

std::string format_key(std::string_view key) {
    if (is_bare_key(key)) return std::string(key);
    return quote(key);
}

std::string format_float(double value) {
    std::string s = double_to_shortest(value);

    // The literal must keep its Float shape: digits '.' digits [exponent]
    size_t exp = s.find_first_of("eE");
    std::string mantissa = (exp == std::string::npos) ? s : s.substr(0, exp);
    std::string exponent = (exp == std::string::npos) ? "" : s.substr(exp);

    if (mantissa.find('.') == std::string::npos) {
        mantissa += ".0";
    }
    return mantissa + exponent;
}

std::string format_scalar(const Value& value) {
    switch (value.kind) {
        case ValueKind::V_NULL:
            return "null";
        case ValueKind::V_BOOL:
            return value.bool_val ? "true" : "false";
        case ValueKind::V_INT:
            return std::to_string(value.int_val);
        case ValueKind::V_FLOAT:
            if (!std::isfinite(value.float_val)) {
                throw ToonError(ErrorType::ENCODING_ERROR,
                                "Non-finite float has no TOON literal");
            }
            return format_float(value.float_val);
        case ValueKind::V_STRING:
            return format_string(value.string_val);
        case ValueKind::V_LIST:
        case ValueKind::V_MAP:
            break;
    }
    throw ToonError(ErrorType::ENCODING_ERROR,
                    std::string("Cannot format ") + kind_name(value.kind) + " as a scalar");
}

} // namespace toonpp
