#ifndef TOONPP_ENCODER_HPP
#define TOONPP_ENCODER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include "toon_errors.hpp"
#include "toon_io.hpp"
#include "toon_value.hpp"

namespace toonpp {

// Encoder options
struct EncodeOptions {
    int indent = 2;                  // Spaces per nesting level
    bool strict = true;              // Reject NaN/Inf instead of writing null
    size_t max_inline_width = 1024;  // Longest "v1, v2, ..." body kept inline; 0 = no limit
};

// Encoder class
class Encoder {
public:
    Encoder(const EncodeOptions& opts = EncodeOptions());

    // Encode a value tree to TOON text
    std::string encode(const Value& value);
    std::string encode(const ValuePtr& value);

    // Encode straight to a file
    void encode_file(const Value& value, const std::string& filepath);

    // Get warnings accumulated during the last encode
    const std::vector<Warning>& warnings() const { return warnings_; }

private:
    void encode_root(const Value& value);
    void encode_map_entries(const Value& map, int depth, bool first_inline);
    void encode_entry(const std::string& key, const Value& value, int depth);
    void encode_list(std::string_view key_text, const Value& list, int depth);
    void encode_tabular_rows(const Value& list, const std::vector<std::string>& columns, int depth);
    void encode_list_item(const Value& item, int depth);

    // Helpers
    std::string scalar_text(const Value& value);
    void write_indent(int depth);
    void write_newline();

    EncodeOptions opts_;
    WriteBuffer buf_;
    std::vector<Warning> warnings_;
};

} // namespace toonpp

#endif // TOONPP_ENCODER_HPP
