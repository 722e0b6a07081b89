#include "checklist_engine/hierarchy.hpp"
#include <algorithm>

namespace checklist {

ContainmentPolicy containment_policy(ItemKind kind) {
    return kind == ItemKind::Title ? ContainmentPolicy::Section : ContainmentPolicy::Depth;
}

bool ends_subtree(ContainmentPolicy policy, int ownerDepth, const Item& candidate) {
    if (policy == ContainmentPolicy::Section) {
        return candidate.kind == ItemKind::Title && candidate.depth <= ownerDepth;
    }
    return candidate.depth <= ownerDepth;
}

size_t subtree_end(const std::vector<Item>& items, size_t index) {
    if (index >= items.size()) return items.size();
    const Item& owner = items[index];
    const ContainmentPolicy policy = containment_policy(owner.kind);
    size_t i = index + 1;
    while (i < items.size() && !ends_subtree(policy, owner.depth, items[i])) ++i;
    return i;
}

size_t child_count(const std::vector<Item>& items, size_t index) {
    if (index >= items.size()) return 0;
    return subtree_end(items, index) - index - 1;
}

std::optional<size_t> parent_index(const std::vector<Item>& items, size_t index) {
    if (index >= items.size()) return std::nullopt;
    const int depth = items[index].depth;
    for (size_t i = index; i > 0; --i) {
        if (items[i - 1].depth < depth) return i - 1;
    }
    return std::nullopt;
}

std::vector<size_t> visible_indices(const std::vector<Item>& items,
                                    const std::unordered_set<std::string>& collapsedIds) {
    std::vector<size_t> out;
    out.reserve(items.size());
    // Skip state of the collapsed item currently hiding its subtree, if any.
    bool skipping = false;
    int skipDepth = 0;
    ContainmentPolicy skipPolicy = ContainmentPolicy::Depth;

    for (size_t i = 0; i < items.size(); ++i) {
        const Item& item = items[i];
        if (skipping) {
            if (!ends_subtree(skipPolicy, skipDepth, item)) continue; // hidden items cannot collapse further
            skipping = false;
        }
        out.push_back(i);
        if (!collapsedIds.empty() && collapsedIds.count(item.id)) {
            skipping = true;
            skipDepth = item.depth;
            skipPolicy = containment_policy(item.kind);
        }
    }
    return out;
}

std::vector<std::string> visible_ids(const std::vector<Item>& items,
                                     const std::unordered_set<std::string>& collapsedIds) {
    std::vector<std::string> out;
    for (size_t idx : visible_indices(items, collapsedIds)) out.push_back(items[idx].id);
    return out;
}

std::optional<size_t> index_of(const std::vector<Item>& items, const std::string& id) {
    auto it = std::find_if(items.begin(), items.end(), [&](const Item& item) { return item.id == id; });
    if (it == items.end()) return std::nullopt;
    return static_cast<size_t>(std::distance(items.begin(), it));
}

} // namespace checklist
