#ifndef TOONPP_TABLE_HPP
#define TOONPP_TABLE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include "toon_errors.hpp"
#include "toon_value.hpp"

namespace toonpp {

// Column type for tabular data
enum class ColType {
    UNKNOWN,   // Only nulls seen so far
    BOOL,
    INT,
    FLOAT,
    STRING
};

const char* col_type_name(ColType type);

// Column type a single cell token implies (UNKNOWN for null)
ColType classify_cell(std::string_view token);

// Per-table converters. The first row fixes one ColType per column; every
// later cell is converted with its column's fixed type.
class TableSchema {
public:
    // Throws SchemaMismatchError for duplicate or empty column names
    TableSchema(std::vector<std::string> fields,
                bool strict = true,
                size_t header_line = 0,
                const std::string& file = "");

    const std::vector<std::string>& fields() const { return fields_; }
    const std::vector<ColType>& types() const { return types_; }
    size_t width() const { return fields_.size(); }
    bool inferred() const { return inferred_; }

    // Phase 1: classify the first row's cells
    void infer(const std::vector<std::string_view>& first_row);

    // Phase 2: convert one cell. Throws TypeError (strict) when the token does
    // not fit the column; lenient mode falls back to generic scalar parsing
    // and records a warning.
    ValuePtr convert(size_t col, std::string_view token, size_t line_no);

    // Build a row map from split cells, inferring on the first call.
    // A row of the wrong width is a SchemaMismatchError in strict mode and is
    // padded with null or truncated otherwise.
    ValuePtr make_row(const std::vector<std::string_view>& cells, size_t line_no);

    const std::vector<Warning>& warnings() const { return warnings_; }

private:
    ValuePtr convert_fixed(size_t col, std::string_view token, size_t line_no, bool& ok);

    std::vector<std::string> fields_;
    std::vector<ColType> types_;
    bool strict_;
    bool inferred_ = false;
    std::string file_;
    std::vector<Warning> warnings_;
};

} // namespace toonpp

#endif // TOONPP_TABLE_HPP
