#ifndef TOONPP_LINES_HPP
#define TOONPP_LINES_HPP

#include <string>
#include <string_view>
#include <optional>
#include <cstddef>
#include "toon_io.hpp"

namespace toonpp {

// One logical line handed to the decoder
struct Line {
    std::string content;   // After indentation, trailing whitespace and comment removed
    size_t indent = 0;     // Leading spaces
    size_t depth = 0;      // indent / indentation unit
    size_t line_no = 0;    // 1-indexed physical line
};

// Forward-only cursor over a LineReader with a one-line pushback slot.
// Blank and comment lines never reach the caller.
class LineSource {
public:
    LineSource(LineReader& reader, bool allow_comments = true, bool strict = true);

    // Returns false at end of input
    bool next(Line& out);

    // Make `line` the next result of next(). Only one line can be pending.
    void pushback(Line line);

    // next() followed by pushback()
    bool peek(Line& out);

    // Indentation unit detected from the first indented line (0 until then)
    size_t indent_unit() const { return unit_; }

    // Largest number of lines ever held in the pushback slot
    size_t max_buffered() const { return max_buffered_; }

    // Physical lines pulled from the reader so far
    size_t lines_read() const { return lines_read_; }

    const std::string& filepath() const { return reader_.filepath(); }

private:
    size_t count_indent(std::string_view line, size_t line_no) const;
    bool is_comment_line(std::string_view content) const;
    void strip_trailing_comment(std::string_view& content) const;

    LineReader& reader_;
    bool allow_comments_;
    bool strict_;

    std::optional<Line> pending_;
    size_t unit_ = 0;
    size_t max_buffered_ = 0;
    size_t lines_read_ = 0;
};

} // namespace toonpp

#endif // TOONPP_LINES_HPP
