#ifndef TOONPP_DECODER_HPP
#define TOONPP_DECODER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include "toon_errors.hpp"
#include "toon_io.hpp"
#include "toon_lines.hpp"
#include "toon_value.hpp"

namespace toonpp {

// Decoder options
struct DecodeOptions {
    bool strict = true;
    bool allow_comments = true;
    bool allow_duplicate_keys = true;
    bool warn = true;
};

// Array header info: key[N]{fields}: values
struct ArrayHeader {
    bool has_key = false;
    std::string key;
    size_t declared_count = 0;
    bool is_tabular = false;
    std::vector<std::string> fields;
    std::string inline_values;  // Text after ':' for flat lists
};

// Line classification
enum class LineType {
    LIST_ITEM,      // - value
    KEY_VALUE,      // key: value (inline)
    KEY_NESTED,     // key: (followed by nested block)
    ARRAY_HEADER,   // key[N]: or [N]: v1, v2
    TABULAR_HEADER, // key[N]{fields}:
    RAW_VALUE       // primitive value
};

struct LineInfo {
    LineType type = LineType::RAW_VALUE;
    std::string key;     // For KEY_* types
    std::string value;   // For KEY_VALUE, LIST_ITEM, RAW_VALUE
    ArrayHeader header;  // For ARRAY_HEADER, TABULAR_HEADER
};

// Classify one line's content (indentation already removed)
LineInfo classify_line(std::string_view content, size_t line_no, const std::string& file = "");

// Parse "[N]", "[N]{f1,f2}" with an optional ":" and trailing values.
// Returns false if `text` does not start with an array header; throws
// SyntaxError for a header that starts correctly but is malformed.
bool parse_array_header(std::string_view text, ArrayHeader& header,
                        size_t line_no, const std::string& file = "");

// Decoder class
class Decoder {
public:
    Decoder(const DecodeOptions& opts = DecodeOptions());

    // Decode from text
    ValuePtr decode_string(std::string_view text);

    // Decode from file
    ValuePtr decode_file(const std::string& filepath);

    // Decode from any line producer
    ValuePtr decode(LineReader& reader);
    ValuePtr decode(LineSource& source);

    // Validate without throwing
    ValidationResult validate_string(std::string_view text);
    ValidationResult validate_file(const std::string& filepath);

    // Get warnings accumulated during the last decode
    const std::vector<Warning>& warnings() const { return warnings_; }

private:
    // Main decoding logic
    ValuePtr decode_block(LineSource& src, size_t depth);
    ValuePtr decode_map(LineSource& src, size_t depth, const Line& first, const LineInfo& first_info);
    ValuePtr decode_entry_value(LineSource& src, size_t depth, const Line& line, const LineInfo& info);
    ValuePtr decode_array(LineSource& src, size_t depth, const Line& line, const ArrayHeader& header);
    ValuePtr decode_tabular(LineSource& src, size_t depth, const Line& line, const ArrayHeader& header);
    ValuePtr decode_inline_list(const Line& line, const ArrayHeader& header);
    ValuePtr decode_bullets(LineSource& src, size_t item_depth, size_t header_line,
                            const ArrayHeader* header);
    ValuePtr decode_list_item(LineSource& src, const Line& bullet, const LineInfo& info);

    // Once a declared count is met, any further line at `min_depth` or deeper is an extra item
    void check_no_extra(LineSource& src, size_t min_depth, const std::string& what,
                        size_t expected, size_t header_line);

    // Error handling
    void count_mismatch(const std::string& what, size_t expected, size_t actual, size_t line);
    void syntax_error(const std::string& msg, const Line& line);
    void warn(const std::string& type, const std::string& msg);

    DecodeOptions opts_;
    std::vector<Warning> warnings_;
    std::string current_file_;
};

} // namespace toonpp

#endif // TOONPP_DECODER_HPP
