#pragma once

#include "checklist_engine/types.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace checklist {

// How far an item's inferred subtree reaches.
//   Section: up to the next Title at the same or a shallower depth (Title items).
//   Depth:   the run of strictly deeper items that follows (every other kind).
enum class ContainmentPolicy {
    Section,
    Depth
};

ContainmentPolicy containment_policy(ItemKind kind);

// True when `candidate` is the first item outside a subtree opened at `ownerDepth`
// under `policy`. child_count and visible_indices both go through this.
bool ends_subtree(ContainmentPolicy policy, int ownerDepth, const Item& candidate);

// One past the last inferred descendant of items[index]; index + 1 for a leaf.
size_t subtree_end(const std::vector<Item>& items, size_t index);

// Number of inferred descendants of items[index]; 0 if index is out of range.
size_t child_count(const std::vector<Item>& items, size_t index);

// Nearest preceding item with a strictly lower depth.
std::optional<size_t> parent_index(const std::vector<Item>& items, size_t index);

// Positions not hidden by a collapsed ancestor, in sequence order.
std::vector<size_t> visible_indices(const std::vector<Item>& items,
                                    const std::unordered_set<std::string>& collapsedIds);
std::vector<std::string> visible_ids(const std::vector<Item>& items,
                                     const std::unordered_set<std::string>& collapsedIds);

std::optional<size_t> index_of(const std::vector<Item>& items, const std::string& id);

} // namespace checklist
