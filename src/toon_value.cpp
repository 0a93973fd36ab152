#include "toon_value.hpp"

namespace toonpp {

const char* kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::V_NULL:   return "null";
        case ValueKind::V_BOOL:   return "bool";
        case ValueKind::V_INT:    return "int";
        case ValueKind::V_FLOAT:  return "float";
        case ValueKind::V_STRING: return "string";
        case ValueKind::V_LIST:   return "list";
        case ValueKind::V_MAP:    return "map";
    }
    return "unknown";
}

// Value factory methods
ValuePtr Value::make_null() {
    return std::make_shared<Value>();
}

ValuePtr Value::make_bool(bool v) {
    auto n = std::make_shared<Value>();
    n->kind = ValueKind::V_BOOL;
    n->bool_val = v;
    return n;
}

ValuePtr Value::make_int(int64_t v) {
    auto n = std::make_shared<Value>();
    n->kind = ValueKind::V_INT;
    n->int_val = v;
    return n;
}

ValuePtr Value::make_float(double v) {
    auto n = std::make_shared<Value>();
    n->kind = ValueKind::V_FLOAT;
    n->float_val = v;
    return n;
}

ValuePtr Value::make_string(const std::string& v) {
    auto n = std::make_shared<Value>();
    n->kind = ValueKind::V_STRING;
    n->string_val = v;
    return n;
}

ValuePtr Value::make_string(std::string_view v) {
    return make_string(std::string(v));
}

ValuePtr Value::make_string(const char* v) {
    return make_string(std::string(v));
}

ValuePtr Value::make_list() {
    auto n = std::make_shared<Value>();
    n->kind = ValueKind::V_LIST;
    return n;
}

ValuePtr Value::make_list(std::vector<ValuePtr> items) {
    auto n = make_list();
    n->list_items = std::move(items);
    return n;
}

ValuePtr Value::make_map() {
    auto n = std::make_shared<Value>();
    n->kind = ValueKind::V_MAP;
    return n;
}

ValuePtr Value::make_map(std::vector<std::pair<std::string, ValuePtr>> items) {
    auto n = make_map();
    for (auto& item : items) {
        n->set(item.first, std::move(item.second));
    }
    return n;
}

size_t Value::size() const {
    if (kind == ValueKind::V_LIST) return list_items.size();
    if (kind == ValueKind::V_MAP) return map_items.size();
    return 0;
}

ValuePtr Value::get(std::string_view key) const {
    for (const auto& item : map_items) {
        if (item.first == key) return item.second;
    }
    return nullptr;
}

bool Value::contains(std::string_view key) const {
    return get(key) != nullptr;
}

void Value::set(const std::string& key, ValuePtr v) {
    if (!v) v = make_null();
    for (auto& item : map_items) {
        if (item.first == key) {
            item.second = std::move(v);
            return;
        }
    }
    map_items.emplace_back(key, std::move(v));
}

void Value::push_back(ValuePtr v) {
    list_items.push_back(v ? std::move(v) : make_null());
}

bool equal(const ValuePtr& a, const ValuePtr& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return *a == *b;
}

bool operator==(const Value& a, const Value& b) {
    if (a.kind != b.kind) return false;

    switch (a.kind) {
        case ValueKind::V_NULL:
            return true;
        case ValueKind::V_BOOL:
            return a.bool_val == b.bool_val;
        case ValueKind::V_INT:
            return a.int_val == b.int_val;
        case ValueKind::V_FLOAT:
            return a.float_val == b.float_val;
        case ValueKind::V_STRING:
            return a.string_val == b.string_val;
        case ValueKind::V_LIST:
            if (a.list_items.size() != b.list_items.size()) return false;
            for (size_t i = 0; i < a.list_items.size(); i++) {
                if (!equal(a.list_items[i], b.list_items[i])) return false;
            }
            return true;
        case ValueKind::V_MAP:
            if (a.map_items.size() != b.map_items.size()) return false;
            for (size_t i = 0; i < a.map_items.size(); i++) {
                if (a.map_items[i].first != b.map_items[i].first) return false;
                if (!equal(a.map_items[i].second, b.map_items[i].second)) return false;
            }
            return true;
    }
    return false;
}

bool operator!=(const Value& a, const Value& b) {
    return !(a == b);
}

} // namespace toonpp
