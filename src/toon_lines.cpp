#include "toon_lines.hpp"
#include "toon_errors.hpp"
#include "toon_scalar.hpp"
#include <cctype>
#include <stdexcept>

namespace toonpp {

LineSource::LineSource(LineReader& reader, bool allow_comments, bool strict)
    : reader_(reader), allow_comments_(allow_comments), strict_(strict) {}

size_t LineSource::count_indent(std::string_view line, size_t line_no) const {
    size_t indent = 0;
    for (char c : line) {
        if (c == ' ') {
            indent++;
        } else if (c == '\t') {
            if (strict_) {
                throw SyntaxError("Tab characters not allowed in indentation (strict mode)",
                                  line_no, indent + 1, make_snippet(std::string(line)),
                                  reader_.filepath());
            }
            indent++; // Count tab as 1 space for non-strict mode
        } else {
            break;
        }
    }
    return indent;
}

bool LineSource::is_comment_line(std::string_view content) const {
    if (content.empty()) return false;
    if (content[0] == '#') return true;
    if (content.size() >= 2 && content[0] == '/' && content[1] == '/') return true;
    return false;
}

void LineSource::strip_trailing_comment(std::string_view& content) const {
    // Find # or // not inside a string
    bool in_string = false;
    bool escape = false;

    for (size_t i = 0; i < content.size(); i++) {
        char c = content[i];

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

        if (in_string || i == 0) continue;

        bool marker = (c == '#') ||
                      (c == '/' && i + 1 < content.size() && content[i + 1] == '/');
        if (marker && std::isspace(static_cast<unsigned char>(content[i - 1]))) {
            content = trim_trailing(content.substr(0, i));
            return;
        }
    }
}

bool LineSource::next(Line& out) {
    if (pending_) {
        out = std::move(*pending_);
        pending_.reset();
        return true;
    }

    std::string_view raw;
    size_t line_no = 0;

    while (reader_.next_line(raw, line_no)) {
        lines_read_++;

        if (trim(raw).empty()) {
            continue;
        }

        size_t indent = count_indent(raw, line_no);
        std::string_view content = trim_trailing(raw.substr(indent));

        if (allow_comments_) {
            if (is_comment_line(content)) {
                continue;
            }
            strip_trailing_comment(content);
        }

        size_t depth = 0;
        if (indent > 0) {
            if (unit_ == 0) {
                unit_ = indent;
            }
            if (indent % unit_ != 0) {
                throw SyntaxError("Indentation of " + std::to_string(indent) +
                                  " spaces is not a multiple of the indentation unit (" +
                                  std::to_string(unit_) + ")",
                                  line_no, indent + 1, make_snippet(std::string(raw)),
                                  reader_.filepath());
            }
            depth = indent / unit_;
        }

        out.content.assign(content.data(), content.size());
        out.indent = indent;
        out.depth = depth;
        out.line_no = line_no;
        return true;
    }

    return false;
}

void LineSource::pushback(Line line) {
    if (pending_) {
        throw std::logic_error("LineSource: pushback slot already holds line " +
                               std::to_string(pending_->line_no));
    }
    pending_ = std::move(line);
    if (max_buffered_ < 1) {
        max_buffered_ = 1;
    }
}

bool LineSource::peek(Line& out) {
    if (!next(out)) return false;
    pushback(out);
    return true;
}

} // namespace toonpp
