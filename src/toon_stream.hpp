#ifndef TOONPP_STREAM_HPP
#define TOONPP_STREAM_HPP

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstddef>
#include "toon_errors.hpp"
#include "toon_io.hpp"
#include "toon_lines.hpp"
#include "toon_decoder.hpp"

namespace toonpp {

// Streaming options
struct StreamOptions {
    bool strict = true;
    bool allow_comments = true;
    bool warn = true;
    std::optional<std::string> key;  // Root key holding the table; first table if unset
};

// Called once per row; return false to stop
using RowVisitor = std::function<bool(const ValuePtr& row, size_t index)>;

// Row streaming parser. Rows are built and handed to the visitor one at a
// time; only the current row is alive.
class TableStreamer {
public:
    TableStreamer(LineReader& reader, const StreamOptions& opts = StreamOptions());

    // Visit every row of the located table. Returns the number of rows visited.
    size_t stream(const RowVisitor& visit);

    // Available once stream() found the header
    const std::vector<std::string>& fields() const { return header_.fields; }
    size_t declared_rows() const { return header_.declared_count; }

    const LineSource& source() const { return source_; }

    // Get accumulated warnings
    const std::vector<Warning>& warnings() const { return warnings_; }

private:
    bool find_tabular_header(Line& header_line);
    bool accept_header(const Line& line, const LineInfo& info);
    void count_mismatch(size_t observed, size_t line_no);

    StreamOptions opts_;
    LineSource source_;
    ArrayHeader header_;
    std::vector<Warning> warnings_;
};

} // namespace toonpp

#endif // TOONPP_STREAM_HPP
