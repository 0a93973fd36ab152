#include "toon_decoder.hpp"
#include "toon_scalar.hpp"
#include "toon_table.hpp"
#include <charconv>
#include <cctype>
#include <unordered_map>

namespace toonpp {

namespace {

// First ':' outside quotes that is followed by whitespace or ends the line
size_t find_key_separator(std::string_view content, size_t from) {
    size_t pos = find_unquoted(content, ':', from);
    while (pos != std::string_view::npos) {
        if (pos + 1 == content.size() ||
            std::isspace(static_cast<unsigned char>(content[pos + 1]))) {
            return pos;
        }
        pos = find_unquoted(content, ':', pos + 1);
    }
    return std::string_view::npos;
}

bool is_header(LineType type) {
    return type == LineType::ARRAY_HEADER || type == LineType::TABULAR_HEADER;
}

bool is_map_entry(const LineInfo& info) {
    if (info.type == LineType::KEY_VALUE || info.type == LineType::KEY_NESTED) return true;
    return is_header(info.type) && info.header.has_key;
}

LineInfo header_info(ArrayHeader header, std::string key, bool has_key) {
    LineInfo info;
    header.key = std::move(key);
    header.has_key = has_key;
    info.type = header.is_tabular ? LineType::TABULAR_HEADER : LineType::ARRAY_HEADER;
    info.header = std::move(header);
    return info;
}

LineInfo key_info(std::string key, std::string_view after_colon) {
    LineInfo info;
    info.key = std::move(key);
    after_colon = trim(after_colon);
    if (after_colon.empty()) {
        info.type = LineType::KEY_NESTED;
    } else {
        info.type = LineType::KEY_VALUE;
        info.value = std::string(after_colon);
    }
    return info;
}

} // namespace

bool parse_array_header(std::string_view text, ArrayHeader& header,
                        size_t line_no, const std::string& file) {
    // Format: [N]: or [N]: v1, v2 or [N]{field1,field2,...}:
    if (text.empty() || text[0] != '[') {
        return false;
    }

    size_t pos = 1;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        pos++;
    }
    if (pos == 1 || pos >= text.size() || text[pos] != ']') {
        return false;
    }

    auto result = std::from_chars(text.data() + 1, text.data() + pos, header.declared_count);
    if (result.ec != std::errc{}) {
        throw SyntaxError("Array length out of range", line_no, 2,
                          make_snippet(std::string(text)), file);
    }
    pos++;

    header.is_tabular = false;
    header.fields.clear();
    header.inline_values.clear();

    // Check for {fields}
    if (pos < text.size() && text[pos] == '{') {
        header.is_tabular = true;
        size_t field_end = find_unquoted(text, '}', pos + 1);
        if (field_end == std::string_view::npos) {
            throw SyntaxError("Unterminated column list in tabular header", line_no, pos + 1,
                              make_snippet(std::string(text)), file);
        }

        std::string_view fields_str = text.substr(pos + 1, field_end - pos - 1);
        for (std::string_view field : split_delimited(fields_str, ',', line_no)) {
            if (field.empty()) {
                throw SchemaMismatchError("Empty column name in tabular header", 0, 0,
                                          line_no, file);
            }
            if (field.front() == '"') {
                header.fields.push_back(unquote(field, true, line_no));
            } else {
                header.fields.push_back(std::string(field));
            }
        }
        pos = field_end + 1;
    }

    // Optional ':' then inline values
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        pos++;
    }
    if (pos == text.size()) {
        return true;
    }
    if (text[pos] != ':') {
        throw SyntaxError("Malformed array header", line_no, pos + 1,
                          make_snippet(std::string(text)), file);
    }

    header.inline_values = std::string(trim(text.substr(pos + 1)));
    if (header.is_tabular && !header.inline_values.empty()) {
        throw SyntaxError("Unexpected values after tabular header", line_no, pos + 2,
                          make_snippet(std::string(text)), file);
    }
    return true;
}

LineInfo classify_line(std::string_view content, size_t line_no, const std::string& file) {
    LineInfo info;

    // List item: "- value" or a bare "-"
    if (content == "-" || (content.size() >= 2 && content[0] == '-' && content[1] == ' ')) {
        info.type = LineType::LIST_ITEM;
        info.value = std::string(trim(content.substr(1)));
        return info;
    }

    // Quoted key: "key": value or "key"[N]...
    if (!content.empty() && content[0] == '"') {
        size_t close = find_closing_quote(content, 0);
        if (close == std::string_view::npos) {
            throw SyntaxError("Unterminated quoted string", line_no, 1,
                              make_snippet(std::string(content)), file);
        }

        std::string_view rest = content.substr(close + 1);
        if (!rest.empty() && rest[0] == '[') {
            ArrayHeader header;
            if (parse_array_header(rest, header, line_no, file)) {
                return header_info(std::move(header), unquote(content.substr(0, close + 1), true, line_no), true);
            }
        }

        std::string_view after = trim(rest);
        if (!after.empty() && after[0] == ':') {
            return key_info(unquote(content.substr(0, close + 1), true, line_no), after.substr(1));
        }

        info.type = LineType::RAW_VALUE;
        info.value = std::string(content);
        return info;
    }

    // Bare key followed by an array header
    size_t pos = content.find_first_of("[:");
    if (pos != std::string_view::npos && content[pos] == '[') {
        ArrayHeader header;
        if (parse_array_header(content.substr(pos), header, line_no, file)) {
            std::string_view key = trim(content.substr(0, pos));
            return header_info(std::move(header), std::string(key), !key.empty());
        }
    }

    // Key-value
    size_t colon_pos = find_key_separator(content, 0);
    if (colon_pos != std::string_view::npos) {
        std::string_view key = trim(content.substr(0, colon_pos));
        if (key.empty()) {
            throw SyntaxError("Missing key before ':'", line_no, colon_pos + 1,
                              make_snippet(std::string(content)), file);
        }
        return key_info(std::string(key), content.substr(colon_pos + 1));
    }

    // Raw value
    info.type = LineType::RAW_VALUE;
    info.value = std::string(trim(content));
    return info;
}

// Decoder implementation
Decoder::Decoder(const DecodeOptions& opts) : opts_(opts) {}

void Decoder::syntax_error(const std::string& msg, const Line& line) {
    throw SyntaxError(msg, line.line_no, line.indent + 1, make_snippet(line.content), current_file_);
}

void Decoder::warn(const std::string& type, const std::string& msg) {
    if (opts_.warn) {
        warnings_.push_back(Warning(type, msg));
    }
}

void Decoder::count_mismatch(const std::string& what, size_t expected, size_t actual, size_t line) {
    if (opts_.strict) {
        throw SchemaMismatchError("Declared [" + std::to_string(expected) + "] but found " +
                                  std::to_string(actual) + " " + what,
                                  expected, actual, line, current_file_);
    }
    warn("n_mismatch", "Declared [" + std::to_string(expected) + "] but observed " +
                       std::to_string(actual) + " " + what + "; using observed.");
}

void Decoder::check_no_extra(LineSource& src, size_t min_depth, const std::string& what,
                             size_t expected, size_t header_line) {
    Line extra;
    if (!src.next(extra)) return;

    if (extra.depth >= min_depth) {
        throw SchemaMismatchError("Declared [" + std::to_string(expected) + "] but found more " +
                                  what + " (line " + std::to_string(extra.line_no) + ")",
                                  expected, expected + 1, header_line, current_file_);
    }
    src.pushback(std::move(extra));
}

ValuePtr Decoder::decode_string(std::string_view text) {
    current_file_.clear();
    StringReader reader(text);
    return decode(reader);
}

ValuePtr Decoder::decode_file(const std::string& filepath) {
    FileReader reader(filepath);
    if (reader.has_error()) {
        throw ToonError(ErrorType::IO_ERROR, reader.error_message(), 0, 0, "", filepath);
    }
    return decode(reader);
}

ValuePtr Decoder::decode(LineReader& reader) {
    LineSource source(reader, opts_.allow_comments, opts_.strict);
    return decode(source);
}

ValuePtr Decoder::decode(LineSource& src) {
    warnings_.clear();
    current_file_ = src.filepath();

    Line first;
    if (!src.peek(first)) {
        // Empty document
        return Value::make_map();
    }
    if (first.depth != 0) {
        src.next(first);
        syntax_error("Unexpected indentation at start of document", first);
    }

    ValuePtr root = decode_block(src, 0);

    Line extra;
    if (src.next(extra)) {
        syntax_error("Unexpected content after the root value", extra);
    }
    return root;
}

ValidationResult Decoder::validate_string(std::string_view text) {
    try {
        decode_string(text);
        return ValidationResult::ok();
    } catch (const ToonError& e) {
        return ValidationResult::error(e);
    }
}

ValidationResult Decoder::validate_file(const std::string& filepath) {
    try {
        decode_file(filepath);
        return ValidationResult::ok();
    } catch (const ToonError& e) {
        return ValidationResult::error(e);
    }
}

ValuePtr Decoder::decode_block(LineSource& src, size_t depth) {
    Line line;
    if (!src.next(line)) {
        return nullptr;
    }

    if (line.depth < depth) {
        // Dedent - save for parent
        src.pushback(std::move(line));
        return nullptr;
    }
    if (line.depth > depth) {
        syntax_error("Unexpected indentation", line);
    }

    LineInfo info = classify_line(line.content, line.line_no, current_file_);

    if (is_map_entry(info)) {
        return decode_map(src, depth, line, info);
    }

    switch (info.type) {
        case LineType::ARRAY_HEADER:
        case LineType::TABULAR_HEADER:
            return decode_array(src, depth, line, info.header);

        case LineType::LIST_ITEM: {
            // Items without a [N] header
            size_t line_no = line.line_no;
            src.pushback(std::move(line));
            return decode_bullets(src, depth, line_no, nullptr);
        }

        default:
            break;
    }

    // A raw value is the whole block
    ValuePtr value = parse_scalar(info.value, opts_.strict, line.line_no);

    Line next;
    if (src.next(next)) {
        if (next.depth > depth) {
            syntax_error("Unexpected indentation after a value", next);
        }
        if (next.depth == depth) {
            if (opts_.strict) {
                syntax_error("Unexpected content after a value", next);
            }
            // Lenient: drop the stray value and decode what follows instead
            warn("orphan_line", "Line " + std::to_string(line.line_no) +
                                " has no key and was skipped: " + make_snippet(line.content));
            src.pushback(std::move(next));
            return decode_block(src, depth);
        }
        src.pushback(std::move(next));
    }
    return value;
}

ValuePtr Decoder::decode_map(LineSource& src, size_t depth, const Line& first,
                             const LineInfo& first_info) {
    auto obj = Value::make_map();
    std::unordered_map<std::string, int> duplicate_counts;
    std::vector<std::string> duplicate_order;

    auto process_entry = [&](const Line& line, const LineInfo& info) {
        const std::string& key = is_header(info.type) ? info.header.key : info.key;

        // Check for duplicates
        for (auto it = obj->map_items.begin(); it != obj->map_items.end(); ++it) {
            if (it->first != key) continue;
            if (!opts_.allow_duplicate_keys) {
                syntax_error("Duplicate key: " + key, line);
            }
            if (duplicate_counts[key]++ == 0) {
                duplicate_order.push_back(key);
            }
            // Remove old entry (last-one-wins)
            obj->map_items.erase(it);
            break;
        }

        ValuePtr value = decode_entry_value(src, depth, line, info);
        obj->map_items.emplace_back(key, std::move(value));
    };

    process_entry(first, first_info);

    // Continue with entries at the same level
    Line line;
    while (src.next(line)) {
        if (line.depth < depth) {
            src.pushback(std::move(line));
            break;
        }
        if (line.depth > depth) {
            syntax_error("Unexpected indentation", line);
        }

        LineInfo info = classify_line(line.content, line.line_no, current_file_);
        if (is_map_entry(info)) {
            process_entry(line, info);
            continue;
        }

        if (!opts_.strict && info.type == LineType::RAW_VALUE) {
            warn("orphan_line", "Line " + std::to_string(line.line_no) +
                                " has no key and was skipped: " + make_snippet(line.content));
            continue;
        }
        syntax_error("Expected 'key: value' inside a map", line);
    }

    // Emit duplicate key warnings
    if (!duplicate_counts.empty()) {
        std::string warn_msg = "Duplicate keys found: ";
        bool first_key = true;
        for (const auto& key : duplicate_order) {
            if (!first_key) warn_msg += ", ";
            warn_msg += key + " (" + std::to_string(duplicate_counts[key] + 1) + " times)";
            first_key = false;
        }
        warn("duplicate_key", warn_msg);
    }

    return obj;
}

ValuePtr Decoder::decode_entry_value(LineSource& src, size_t depth, const Line& line,
                                     const LineInfo& info) {
    if (is_header(info.type)) {
        return decode_array(src, depth, line, info.header);
    }

    if (info.type == LineType::KEY_NESTED) {
        ValuePtr child = decode_block(src, depth + 1);
        return child ? child : Value::make_map();
    }

    // Inline value; may itself be an array header ("key: [3]: a, b")
    const std::string& value = info.value;
    if (!value.empty() && value[0] == '[') {
        if (value == "[]") {
            return Value::make_list();
        }
        ArrayHeader header;
        if (parse_array_header(value, header, line.line_no, current_file_)) {
            header.has_key = true;
            header.key = info.key;
            return decode_array(src, depth, line, header);
        }
    }
    return parse_scalar(value, opts_.strict, line.line_no);
}

ValuePtr Decoder::decode_array(LineSource& src, size_t depth, const Line& line,
                               const ArrayHeader& header) {
    if (header.is_tabular) {
        return decode_tabular(src, depth, line, header);
    }
    if (!header.inline_values.empty()) {
        return decode_inline_list(line, header);
    }
    return decode_bullets(src, depth + 1, line.line_no, &header);
}

ValuePtr Decoder::decode_inline_list(const Line& line, const ArrayHeader& header) {
    auto arr = Value::make_list();
    auto cells = split_delimited(header.inline_values, ',', line.line_no);

    if (cells.size() != header.declared_count) {
        count_mismatch("values", header.declared_count, cells.size(), line.line_no);
    }

    arr->list_items.reserve(cells.size());
    for (std::string_view cell : cells) {
        arr->list_items.push_back(parse_scalar(cell, opts_.strict, line.line_no));
    }
    return arr;
}

ValuePtr Decoder::decode_tabular(LineSource& src, size_t depth, const Line& line,
                                 const ArrayHeader& header) {
    TableSchema schema(header.fields, opts_.strict, line.line_no, current_file_);
    auto arr = Value::make_list();

    size_t row_depth = depth + 1;

    // A keyless root table may list its rows without indentation
    if (!header.has_key && depth == 0) {
        Line peeked;
        if (src.peek(peeked) && peeked.depth == 0) {
            row_depth = 0;
        }
    }

    Line row;
    while (!(opts_.strict && arr->list_items.size() == header.declared_count)) {
        if (!src.next(row)) break;

        if (row.depth < row_depth) {
            src.pushback(std::move(row));
            break;
        }
        if (row.depth > row_depth) {
            syntax_error("Unexpected indentation in tabular row", row);
        }

        auto cells = split_delimited(row.content, ',', row.line_no);
        arr->list_items.push_back(schema.make_row(cells, row.line_no));
    }

    if (opts_.strict && arr->list_items.size() == header.declared_count) {
        check_no_extra(src, row_depth, "rows", header.declared_count, line.line_no);
    }
    if (arr->list_items.size() != header.declared_count) {
        count_mismatch("rows", header.declared_count, arr->list_items.size(), line.line_no);
    }

    for (const auto& w : schema.warnings()) {
        warn(w.type, w.message);
    }
    return arr;
}

ValuePtr Decoder::decode_bullets(LineSource& src, size_t item_depth, size_t header_line,
                                 const ArrayHeader* header) {
    auto arr = Value::make_list();
    const size_t expected = header ? header->declared_count : 0;

    Line line;
    while (!(header && opts_.strict && arr->list_items.size() == expected)) {
        if (!src.next(line)) break;

        if (line.depth < item_depth) {
            src.pushback(std::move(line));
            break;
        }
        if (line.depth > item_depth) {
            syntax_error("Unexpected indentation in list", line);
        }

        LineInfo info = classify_line(line.content, line.line_no, current_file_);
        if (info.type != LineType::LIST_ITEM) {
            if (!header) {
                // Headerless list ends at the first non-item line
                src.pushback(std::move(line));
                break;
            }
            syntax_error("Expected '- ' list item", line);
        }

        arr->list_items.push_back(decode_list_item(src, line, info));
    }

    if (header) {
        if (opts_.strict && arr->list_items.size() == expected) {
            check_no_extra(src, item_depth, "items", expected, header_line);
        }
        if (arr->list_items.size() != expected) {
            count_mismatch("items", expected, arr->list_items.size(), header_line);
        }
    }
    return arr;
}

ValuePtr Decoder::decode_list_item(LineSource& src, const Line& bullet, const LineInfo& info) {
    const size_t content_depth = bullet.depth + 1;

    if (info.value.empty()) {
        // Bare "-": the element is the nested block, or an empty map
        ValuePtr child = decode_block(src, content_depth);
        return child ? child : Value::make_map();
    }

    // Re-read the text after "- " as the first line of the element's block
    Line remainder;
    remainder.content = info.value;
    remainder.indent = bullet.indent + 2;
    remainder.depth = content_depth;
    remainder.line_no = bullet.line_no;
    src.pushback(std::move(remainder));

    return decode_block(src, content_depth);
}

} // namespace toonpp
