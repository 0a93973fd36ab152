#include "toon_encoder.hpp"
#include "toon_layout.hpp"
#include "toon_scalar.hpp"
#include <cmath>
#include <stdexcept>

namespace toonpp {

Encoder::Encoder(const EncodeOptions& opts) : opts_(opts) {
    if (opts_.indent < 1) {
        throw std::invalid_argument("EncodeOptions::indent must be at least 1");
    }
}

void Encoder::write_indent(int depth) {
    if (depth > 0) {
        buf_.append_repeat(' ', static_cast<size_t>(depth) * static_cast<size_t>(opts_.indent));
    }
}

void Encoder::write_newline() {
    buf_.append_char('\n');
}

std::string Encoder::scalar_text(const Value& value) {
    if (value.kind == ValueKind::V_FLOAT && !std::isfinite(value.float_val)) {
        if (opts_.strict) {
            if (std::isnan(value.float_val)) {
                throw ToonError(ErrorType::ENCODING_ERROR, "NaN values not allowed in strict mode");
            }
            throw ToonError(ErrorType::ENCODING_ERROR, "Inf/-Inf values not allowed in strict mode");
        }
        warnings_.push_back(Warning("non_finite", "Non-finite float written as null"));
        return "null";
    }
    return format_scalar(value);
}

void Encoder::encode_map_entries(const Value& map, int depth, bool first_inline) {
    for (size_t i = 0; i < map.map_items.size(); i++) {
        // After "- " the first entry shares the bullet line
        if (i > 0 || !first_inline) {
            write_indent(depth);
        }
        const auto& entry = map.map_items[i];
        encode_entry(entry.first, entry.second ? *entry.second : *Value::make_null(), depth);
    }
}

void Encoder::encode_entry(const std::string& key, const Value& value, int depth) {
    std::string key_text = format_key(key);

    if (value.is_list()) {
        encode_list(key_text, value, depth);
        return;
    }

    buf_.append(key_text);
    if (value.is_map()) {
        buf_.append_char(':');
        write_newline();
        encode_map_entries(value, depth + 1, false);
        return;
    }

    buf_.append(": ", 2);
    buf_.append(scalar_text(value));
    write_newline();
}

void Encoder::encode_list(std::string_view key_text, const Value& list, int depth) {
    const size_t n = list.list_items.size();
    ListLayout layout = classify_list(list);

    std::string joined;
    if (layout == ListLayout::FLAT_SCALAR) {
        for (size_t i = 0; i < n; i++) {
            if (i > 0) joined += ", ";
            const ValuePtr& item = list.list_items[i];
            joined += item ? scalar_text(*item) : "null";
        }
        if (opts_.max_inline_width > 0 && joined.size() > opts_.max_inline_width) {
            layout = ListLayout::BULLETED;
        }
    }

    // Header: key[N]
    buf_.append(key_text);
    buf_.append_char('[');
    buf_.append(std::to_string(n));
    buf_.append_char(']');

    switch (layout) {
        case ListLayout::TABULAR: {
            std::vector<std::string> columns = tabular_columns(list);
            buf_.append_char('{');
            for (size_t j = 0; j < columns.size(); j++) {
                if (j > 0) buf_.append_char(',');
                buf_.append(format_key(columns[j]));
            }
            buf_.append("}:", 2);
            write_newline();
            encode_tabular_rows(list, columns, depth + 1);
            break;
        }

        case ListLayout::FLAT_SCALAR:
            buf_.append_char(':');
            if (n > 0) {
                buf_.append_char(' ');
                buf_.append(joined);
            }
            write_newline();
            break;

        case ListLayout::BULLETED:
            buf_.append_char(':');
            write_newline();
            for (const auto& item : list.list_items) {
                write_indent(depth + 1);
                encode_list_item(item ? *item : *Value::make_null(), depth + 1);
            }
            break;
    }
}

void Encoder::encode_tabular_rows(const Value& list, const std::vector<std::string>& columns,
                                  int depth) {
    for (size_t i = 0; i < list.list_items.size(); i++) {
        const ValuePtr& row = list.list_items[i];

        if (!row || !row->is_map() || row->map_items.size() != columns.size()) {
            throw EncodingInvariantError("Tabular row " + std::to_string(i) +
                                         " does not match the " +
                                         std::to_string(columns.size()) + "-column header");
        }

        write_indent(depth);
        for (size_t j = 0; j < columns.size(); j++) {
            const auto& entry = row->map_items[j];
            if (entry.first != columns[j]) {
                throw EncodingInvariantError("Tabular row " + std::to_string(i) + " has key '" +
                                             entry.first + "' where the header has '" +
                                             columns[j] + "'");
            }
            if (entry.second && !entry.second->is_scalar()) {
                throw EncodingInvariantError("Tabular row " + std::to_string(i) + " column '" +
                                             columns[j] + "' holds a " +
                                             kind_name(entry.second->kind));
            }

            if (j > 0) buf_.append_char(',');
            buf_.append(entry.second ? scalar_text(*entry.second) : std::string("null"));
        }
        write_newline();
    }
}

void Encoder::encode_list_item(const Value& item, int depth) {
    if (item.is_map()) {
        if (item.map_items.empty()) {
            buf_.append_char('-');
            write_newline();
            return;
        }
        buf_.append("- ", 2);
        encode_map_entries(item, depth + 1, true);
        return;
    }

    buf_.append("- ", 2);
    if (item.is_list()) {
        encode_list("", item, depth + 1);
        return;
    }

    buf_.append(scalar_text(item));
    write_newline();
}

void Encoder::encode_root(const Value& value) {
    if (value.is_map()) {
        encode_map_entries(value, 0, false);
    } else if (value.is_list()) {
        encode_list("", value, 0);
    } else {
        buf_.append(scalar_text(value));
        write_newline();
    }
}

std::string Encoder::encode(const Value& value) {
    buf_.clear();
    warnings_.clear();
    encode_root(value);
    return buf_.str();
}

std::string Encoder::encode(const ValuePtr& value) {
    if (!value) {
        return encode(*Value::make_null());
    }
    return encode(*value);
}

void Encoder::encode_file(const Value& value, const std::string& filepath) {
    buf_.clear();
    warnings_.clear();
    encode_root(value);
    if (!buf_.write_to_file(filepath)) {
        throw ToonError(ErrorType::IO_ERROR, "Cannot write file: " + filepath,
                        0, 0, "", filepath);
    }
}

} // namespace toonpp
