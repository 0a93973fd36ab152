#ifndef TOONPP_VALUE_HPP
#define TOONPP_VALUE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <cstdint>
#include <utility>

namespace toonpp {

// Forward declarations
struct Value;
using ValuePtr = std::shared_ptr<Value>;

// Value kinds
enum class ValueKind {
    V_NULL,
    V_BOOL,
    V_INT,
    V_FLOAT,
    V_STRING,
    V_LIST,
    V_MAP
};

const char* kind_name(ValueKind kind);

// In-memory TOON value shared by the encoder and the decoder
struct Value {
    ValueKind kind = ValueKind::V_NULL;

    // Scalar storage
    bool bool_val = false;
    int64_t int_val = 0;
    double float_val = 0.0;
    std::string string_val;

    // Children for list/map
    std::vector<ValuePtr> list_items;
    std::vector<std::pair<std::string, ValuePtr>> map_items;

    // Factory methods
    static ValuePtr make_null();
    static ValuePtr make_bool(bool v);
    static ValuePtr make_int(int64_t v);
    static ValuePtr make_float(double v);
    static ValuePtr make_string(const std::string& v);
    static ValuePtr make_string(std::string_view v);
    static ValuePtr make_string(const char* v);
    static ValuePtr make_list();
    static ValuePtr make_list(std::vector<ValuePtr> items);
    static ValuePtr make_map();
    static ValuePtr make_map(std::vector<std::pair<std::string, ValuePtr>> items);

    bool is_null() const { return kind == ValueKind::V_NULL; }
    bool is_list() const { return kind == ValueKind::V_LIST; }
    bool is_map() const { return kind == ValueKind::V_MAP; }
    bool is_scalar() const { return !is_list() && !is_map(); }

    // Number of list items or map entries; 0 for scalars
    size_t size() const;

    // Map access. get() returns nullptr for a missing key.
    ValuePtr get(std::string_view key) const;
    bool contains(std::string_view key) const;
    void set(const std::string& key, ValuePtr v);

    // List append
    void push_back(ValuePtr v);
};

// Structural equality, including list order and map key order
bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);
bool equal(const ValuePtr& a, const ValuePtr& b);

} // namespace toonpp

#endif // TOONPP_VALUE_HPP
