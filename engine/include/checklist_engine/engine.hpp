#pragma once

#include "checklist_engine/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace checklist {

// Result of a mutation: the new value, whether anything changed, and the ids of
// any items/checklists/groups the edit created. A refused edit carries the input
// value unchanged with applied == false.
template <typename T>
struct Edit {
    T value;
    bool applied = false;
    std::vector<std::string> created;
};

using ItemEdit = Edit<std::vector<Item>>;

// Item sequence edits. None of these rewrite neighbouring depths or cascade to
// inferred descendants.
ItemEdit insert_item(const std::vector<Item>& items, ItemKind kind,
                     std::optional<size_t> afterIndex, IdSource& ids);
ItemEdit remove_item(const std::vector<Item>& items, const std::string& id);
ItemEdit remove_items(const std::vector<Item>& items, const std::vector<std::string>& ids);
ItemEdit duplicate_item(const std::vector<Item>& items, const std::string& id, IdSource& ids);
// Clones the listed items in sequence order as one block after the last of them.
ItemEdit duplicate_items(const std::vector<Item>& items, const std::vector<std::string>& targets,
                         IdSource& ids);
// delta must be +1 or -1; refused when the result would leave [0, 3].
ItemEdit set_depth(const std::vector<Item>& items, const std::string& id, int delta);
ItemEdit reorder_item(const std::vector<Item>& items, size_t fromIndex, size_t toIndex);
// Moves the listed items, keeping their relative order, into the remaining
// sequence at min(targetIndex, remaining size).
ItemEdit reorder_items(const std::vector<Item>& items, const std::vector<std::string>& targets,
                       size_t targetIndex);
ItemEdit update_item(const std::vector<Item>& items, const std::string& id, const ItemChanges& changes);
// Uppercases challenge/response text of challenge items; all of them when id is empty.
ItemEdit uppercase_items(const std::vector<Item>& items, const std::string& id = std::string());

// Utilities
Item make_item(ItemKind kind, int depth, IdSource& ids);
bool is_challenge_kind(ItemKind kind);

} // namespace checklist
