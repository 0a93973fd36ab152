#ifndef TOONPP_LAYOUT_HPP
#define TOONPP_LAYOUT_HPP

#include <string>
#include <vector>
#include "toon_value.hpp"

namespace toonpp {

// How the encoder writes a list
enum class ListLayout {
    TABULAR,      // key[n]{c1,c2}: followed by one row per element
    FLAT_SCALAR,  // key[n]: v1, v2, ...
    BULLETED      // key[n]: followed by one "- " item per element
};

const char* layout_name(ListLayout layout);

// True when every element is a Map with the same non-empty ordered key set,
// every cell is a scalar, and the non-null cells of each column share one
// scalar kind. Empty lists are never tabular.
bool is_tabular_eligible(const Value& list);

// True when every element is a scalar (vacuously true for an empty list)
bool is_flat_scalar(const Value& list);

// Pure classification of a list's content. Width limits are applied by the
// encoder on top of this.
ListLayout classify_list(const Value& list);

// Column keys of a tabular-eligible list, in order
std::vector<std::string> tabular_columns(const Value& list);

} // namespace toonpp

#endif // TOONPP_LAYOUT_HPP
