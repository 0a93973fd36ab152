#include "toon_stream.hpp"
#include "toon_scalar.hpp"
#include "toon_table.hpp"

namespace toonpp {

TableStreamer::TableStreamer(LineReader& reader, const StreamOptions& opts)
    : opts_(opts), source_(reader, opts.allow_comments, opts.strict) {}

bool TableStreamer::accept_header(const Line& line, const LineInfo& info) {
    if (info.type == LineType::TABULAR_HEADER) {
        header_ = info.header;
        return true;
    }

    // "key: [N]{fields}:"
    if (info.type == LineType::KEY_VALUE && !info.value.empty() && info.value[0] == '[') {
        ArrayHeader header;
        if (parse_array_header(info.value, header, line.line_no, source_.filepath()) &&
            header.is_tabular) {
            header.has_key = true;
            header.key = info.key;
            header_ = std::move(header);
            return true;
        }
    }
    return false;
}

bool TableStreamer::find_tabular_header(Line& header_line) {
    Line line;

    // If key is specified, only root entries are candidates
    if (opts_.key.has_value()) {
        const std::string& target_key = opts_.key.value();

        while (source_.next(line)) {
            if (line.depth != 0) continue;

            LineInfo info = classify_line(line.content, line.line_no, source_.filepath());
            const std::string& key = (info.type == LineType::TABULAR_HEADER ||
                                      info.type == LineType::ARRAY_HEADER)
                                         ? info.header.key
                                         : info.key;
            if (key != target_key) continue;

            if (accept_header(line, info)) {
                header_line = std::move(line);
                return true;
            }
            throw SyntaxError("Key '" + target_key + "' does not hold a tabular array",
                              line.line_no, 1, make_snippet(line.content), source_.filepath());
        }

        throw ToonError(ErrorType::SYNTAX_ERROR, "Key not found: " + target_key,
                        0, 0, "", source_.filepath());
    }

    // Find tabular header
    while (source_.next(line)) {
        LineInfo info = classify_line(line.content, line.line_no, source_.filepath());
        if (accept_header(line, info)) {
            header_line = std::move(line);
            return true;
        }
    }

    return false;
}

void TableStreamer::count_mismatch(size_t observed, size_t line_no) {
    const size_t declared = header_.declared_count;
    if (opts_.strict) {
        throw SchemaMismatchError("Declared [" + std::to_string(declared) + "] but found " +
                                  std::to_string(observed) + " rows",
                                  declared, observed, line_no, source_.filepath());
    }
    if (opts_.warn) {
        warnings_.push_back(Warning("n_mismatch",
            "Declared [" + std::to_string(declared) + "] but observed " +
            std::to_string(observed) + " rows; using observed."));
    }
}

size_t TableStreamer::stream(const RowVisitor& visit) {
    warnings_.clear();

    Line header_line;
    if (!find_tabular_header(header_line)) {
        throw ToonError(ErrorType::SYNTAX_ERROR, "No tabular array found",
                        0, 0, "", source_.filepath());
    }

    TableSchema schema(header_.fields, opts_.strict, header_line.line_no, source_.filepath());

    size_t row_depth = header_line.depth + 1;
    if (!header_.has_key && header_line.depth == 0) {
        Line peeked;
        if (source_.peek(peeked) && peeked.depth == 0) {
            row_depth = 0;
        }
    }

    size_t observed_rows = 0;
    bool stopped = false;
    Line line;

    while (source_.next(line)) {
        if (line.depth < row_depth) {
            source_.pushback(std::move(line));
            break;
        }
        if (line.depth > row_depth) {
            throw SyntaxError("Unexpected indentation in tabular row", line.line_no,
                              line.indent + 1, make_snippet(line.content), source_.filepath());
        }

        if (opts_.strict && observed_rows == header_.declared_count) {
            throw SchemaMismatchError("Declared [" + std::to_string(header_.declared_count) +
                                      "] but found more rows (line " +
                                      std::to_string(line.line_no) + ")",
                                      header_.declared_count, observed_rows + 1,
                                      header_line.line_no, source_.filepath());
        }

        auto cells = split_delimited(line.content, ',', line.line_no);
        ValuePtr row = schema.make_row(cells, line.line_no);

        if (!visit(row, observed_rows++)) {
            stopped = true;
            break;
        }
    }

    if (!stopped && observed_rows != header_.declared_count) {
        count_mismatch(observed_rows, header_line.line_no);
    }

    if (opts_.warn) {
        for (const auto& w : schema.warnings()) {
            warnings_.push_back(w);
        }
    }
    return observed_rows;
}

} // namespace toonpp
