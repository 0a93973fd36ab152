#include "toon_layout.hpp"

namespace toonpp {

const char* layout_name(ListLayout layout) {
    switch (layout) {
        case ListLayout::TABULAR:     return "tabular";
        case ListLayout::FLAT_SCALAR: return "flat";
        case ListLayout::BULLETED:    return "bulleted";
    }
    return "unknown";
}

bool is_tabular_eligible(const Value& list) {
    if (!list.is_list() || list.list_items.empty()) return false;

    const ValuePtr& first = list.list_items.front();
    if (!first || !first->is_map() || first->map_items.empty()) return false;

    const auto& header = first->map_items;
    const size_t ncol = header.size();

    // Kind of the first non-null cell per column
    std::vector<ValueKind> col_kinds(ncol, ValueKind::V_NULL);

    for (const auto& item : list.list_items) {
        if (!item || !item->is_map() || item->map_items.size() != ncol) {
            return false;
        }

        for (size_t j = 0; j < ncol; j++) {
            const auto& entry = item->map_items[j];
            if (entry.first != header[j].first) return false;

            const ValuePtr& cell = entry.second;
            if (!cell || cell->is_null()) continue;
            if (!cell->is_scalar()) return false;

            if (col_kinds[j] == ValueKind::V_NULL) {
                col_kinds[j] = cell->kind;
            } else if (col_kinds[j] != cell->kind) {
                return false;
            }
        }
    }

    return true;
}

bool is_flat_scalar(const Value& list) {
    if (!list.is_list()) return false;
    for (const auto& item : list.list_items) {
        if (item && !item->is_scalar()) return false;
    }
    return true;
}

ListLayout classify_list(const Value& list) {
    if (is_tabular_eligible(list)) return ListLayout::TABULAR;
    if (is_flat_scalar(list)) return ListLayout::FLAT_SCALAR;
    return ListLayout::BULLETED;
}

std::vector<std::string> tabular_columns(const Value& list) {
    std::vector<std::string> columns;
    if (!list.is_list() || list.list_items.empty()) return columns;

    const ValuePtr& first = list.list_items.front();
    if (!first || !first->is_map()) return columns;

    columns.reserve(first->map_items.size());
    for (const auto& entry : first->map_items) {
        columns.push_back(entry.first);
    }
    return columns;
}

} // namespace toonpp
