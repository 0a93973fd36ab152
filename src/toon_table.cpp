#include "toon_table.hpp"
#include "toon_scalar.hpp"
#include <algorithm>
#include <unordered_set>

namespace toonpp {

const char* col_type_name(ColType type) {
    switch (type) {
        case ColType::UNKNOWN: return "unknown";
        case ColType::BOOL:    return "bool";
        case ColType::INT:     return "int";
        case ColType::FLOAT:   return "float";
        case ColType::STRING:  return "string";
    }
    return "unknown";
}

ColType classify_cell(std::string_view token) {
    switch (classify_token(trim(token))) {
        case ScalarKind::NULL_LITERAL: return ColType::UNKNOWN;
        case ScalarKind::BOOL:         return ColType::BOOL;
        case ScalarKind::INT:          return ColType::INT;
        case ScalarKind::FLOAT:        return ColType::FLOAT;
        case ScalarKind::STRING:
        case ScalarKind::QUOTED:       return ColType::STRING;
    }
    return ColType::STRING;
}

TableSchema::TableSchema(std::vector<std::string> fields, bool strict,
                         size_t header_line, const std::string& file)
    : fields_(std::move(fields)),
      types_(fields_.size(), ColType::UNKNOWN),
      strict_(strict),
      file_(file) {
    if (fields_.empty()) {
        throw SchemaMismatchError("Tabular header declares no columns", 1, 0,
                                  header_line, file_);
    }

    std::unordered_set<std::string> seen;
    for (const auto& field : fields_) {
        if (!seen.insert(field).second) {
            throw SchemaMismatchError("Duplicate column '" + field + "' in tabular header",
                                      fields_.size(), seen.size(), header_line, file_);
        }
    }
}

void TableSchema::infer(const std::vector<std::string_view>& first_row) {
    size_t n = std::min(first_row.size(), types_.size());
    for (size_t j = 0; j < n; j++) {
        types_[j] = classify_cell(first_row[j]);
    }
    inferred_ = true;
}

ValuePtr TableSchema::convert_fixed(size_t col, std::string_view token, size_t line_no, bool& ok) {
    ok = true;
    ScalarKind kind = classify_token(token);

    // null fits every column
    if (kind == ScalarKind::NULL_LITERAL) {
        return Value::make_null();
    }

    // First non-null cell of a column that started with null
    if (types_[col] == ColType::UNKNOWN) {
        types_[col] = classify_cell(token);
    }

    switch (types_[col]) {
        case ColType::BOOL:
            if (kind == ScalarKind::BOOL) return Value::make_bool(token == "true");
            break;
        case ColType::INT:
            if (kind == ScalarKind::INT) return Value::make_int(*parse_int(token));
            break;
        case ColType::FLOAT:
            if (kind == ScalarKind::FLOAT) return Value::make_float(*parse_float(token));
            break;
        case ColType::STRING:
            if (kind == ScalarKind::QUOTED) {
                return Value::make_string(unquote(token, strict_, line_no));
            }
            // Bare tokens of any shape are kept as text
            return Value::make_string(token);
        case ColType::UNKNOWN:
            break;
    }

    ok = false;
    return nullptr;
}

ValuePtr TableSchema::convert(size_t col, std::string_view token, size_t line_no) {
    token = trim(token);

    if (token.empty()) {
        if (strict_) {
            throw SyntaxError("Empty cell in column '" + fields_[col] + "'", line_no, 0, "", file_);
        }
        return Value::make_null();
    }

    bool ok = false;
    ValuePtr value = convert_fixed(col, token, line_no, ok);
    if (ok) return value;

    std::string msg = "Column '" + fields_[col] + "' expects " + col_type_name(types_[col]) +
                      " but got '" + std::string(token) + "'";
    if (strict_) {
        throw TypeError(msg, fields_[col], line_no, make_snippet(std::string(token)), file_);
    }

    warnings_.push_back(Warning("type_fallback", msg + " (line " + std::to_string(line_no) + ")"));
    return parse_scalar(token, false, line_no);
}

ValuePtr TableSchema::make_row(const std::vector<std::string_view>& cells, size_t line_no) {
    if (cells.size() != fields_.size()) {
        std::string msg = "Row has " + std::to_string(cells.size()) + " cells but the header declares " +
                          std::to_string(fields_.size()) + " columns";
        if (strict_) {
            throw SchemaMismatchError(msg, fields_.size(), cells.size(), line_no, file_);
        }
        warnings_.push_back(Warning("ragged_row", msg + " (line " + std::to_string(line_no) + ")"));
    }

    if (!inferred_) {
        infer(cells);
    }

    auto row = Value::make_map();
    row->map_items.reserve(fields_.size());
    for (size_t j = 0; j < fields_.size(); j++) {
        ValuePtr cell = (j < cells.size()) ? convert(j, cells[j], line_no) : Value::make_null();
        row->map_items.emplace_back(fields_[j], std::move(cell));
    }
    return row;
}

} // namespace toonpp
