#include "checklist_engine/engine.hpp"
#include "checklist_engine/hierarchy.hpp"
#include "checklist_engine/state_utils.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace checklist {

static ItemEdit unchanged(const std::vector<Item>& items) {
    return ItemEdit{ items, false, {} };
}

static std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

static bool same_order(const std::vector<Item>& a, const std::vector<Item>& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](const Item& x, const Item& y) { return x.id == y.id; });
}

Item make_item(ItemKind kind, int depth, IdSource& ids) {
    Item item;
    item.id = make_new_id(ids);
    item.kind = kind;
    item.depth = depth;
    return item;
}

bool is_challenge_kind(ItemKind kind) {
    return kind == ItemKind::ChallengeResponse || kind == ItemKind::ChallengeOnly;
}

ItemEdit insert_item(const std::vector<Item>& items, ItemKind kind,
                     std::optional<size_t> afterIndex, IdSource& ids) {
    if (afterIndex && *afterIndex >= items.size()) return unchanged(items);
    const size_t insertAt = afterIndex ? *afterIndex + 1 : items.size();
    // inherit depth from the item that will precede the new one
    const int depth = insertAt > 0 ? items[insertAt - 1].depth : kMinDepth;
    ItemEdit edit{ items, true, {} };
    Item item = make_item(kind, depth, ids);
    edit.created.push_back(item.id);
    edit.value.insert(edit.value.begin() + static_cast<std::ptrdiff_t>(insertAt), std::move(item));
    return edit;
}

ItemEdit remove_item(const std::vector<Item>& items, const std::string& id) {
    auto idx = index_of(items, id);
    if (!idx) return unchanged(items);
    ItemEdit edit{ items, true, {} };
    edit.value.erase(edit.value.begin() + static_cast<std::ptrdiff_t>(*idx));
    return edit;
}

ItemEdit remove_items(const std::vector<Item>& items, const std::vector<std::string>& ids) {
    std::unordered_set<std::string> doomed(ids.begin(), ids.end());
    ItemEdit edit{ {}, false, {} };
    edit.value.reserve(items.size());
    for (const auto& item : items) {
        if (doomed.count(item.id)) {
            edit.applied = true;
            continue;
        }
        edit.value.push_back(item);
    }
    if (!edit.applied) return unchanged(items);
    return edit;
}

ItemEdit duplicate_item(const std::vector<Item>& items, const std::string& id, IdSource& ids) {
    auto idx = index_of(items, id);
    if (!idx) return unchanged(items);
    Item copy = items[*idx];
    copy.id = make_new_id(ids);
    ItemEdit edit{ items, true, { copy.id } };
    edit.value.insert(edit.value.begin() + static_cast<std::ptrdiff_t>(*idx + 1), std::move(copy));
    return edit;
}

ItemEdit duplicate_items(const std::vector<Item>& items, const std::vector<std::string>& targets,
                         IdSource& ids) {
    std::unordered_set<std::string> wanted(targets.begin(), targets.end());
    std::vector<Item> clones;
    size_t lastIdx = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        if (!wanted.count(items[i].id)) continue;
        clones.push_back(items[i]);
        lastIdx = i;
    }
    if (clones.empty()) return unchanged(items);
    ItemEdit edit{ items, true, {} };
    for (auto& clone : clones) {
        clone.id = make_new_id(ids);
        edit.created.push_back(clone.id);
    }
    edit.value.insert(edit.value.begin() + static_cast<std::ptrdiff_t>(lastIdx + 1),
                      clones.begin(), clones.end());
    return edit;
}

ItemEdit set_depth(const std::vector<Item>& items, const std::string& id, int delta) {
    if (delta != 1 && delta != -1) return unchanged(items);
    auto idx = index_of(items, id);
    if (!idx) return unchanged(items);
    const int depth = items[*idx].depth + delta;
    if (!is_valid_depth(depth)) return unchanged(items); // refuse, never clamp
    ItemEdit edit{ items, true, {} };
    edit.value[*idx].depth = depth;
    return edit;
}

ItemEdit reorder_item(const std::vector<Item>& items, size_t fromIndex, size_t toIndex) {
    ItemEdit edit{ items, false, {} };
    edit.applied = move_element(edit.value, fromIndex, toIndex);
    if (!edit.applied) return unchanged(items);
    return edit;
}

ItemEdit reorder_items(const std::vector<Item>& items, const std::vector<std::string>& targets,
                       size_t targetIndex) {
    std::unordered_set<std::string> moving(targets.begin(), targets.end());
    std::vector<Item> extracted;
    std::vector<Item> remaining;
    remaining.reserve(items.size());
    for (const auto& item : items) {
        if (moving.count(item.id)) extracted.push_back(item);
        else remaining.push_back(item);
    }
    if (extracted.empty()) return unchanged(items);
    const size_t at = std::min(targetIndex, remaining.size());
    remaining.insert(remaining.begin() + static_cast<std::ptrdiff_t>(at), extracted.begin(), extracted.end());
    if (same_order(items, remaining)) return unchanged(items);
    return ItemEdit{ std::move(remaining), true, {} };
}

ItemEdit update_item(const std::vector<Item>& items, const std::string& id, const ItemChanges& changes) {
    auto idx = index_of(items, id);
    if (!idx) return unchanged(items);
    if (changes.depth && !is_valid_depth(*changes.depth)) return unchanged(items);
    Item updated = items[*idx];
    if (changes.kind) updated.kind = *changes.kind;
    if (changes.challenge) updated.challenge = *changes.challenge;
    if (changes.response) updated.response = *changes.response;
    if (changes.depth) updated.depth = *changes.depth;
    if (changes.centered) updated.centered = *changes.centered;
    if (changes.collapsible) updated.collapsible = *changes.collapsible;
    if (updated == items[*idx]) return unchanged(items);
    ItemEdit edit{ items, true, {} };
    edit.value[*idx] = std::move(updated);
    return edit;
}

ItemEdit uppercase_items(const std::vector<Item>& items, const std::string& id) {
    ItemEdit edit{ items, false, {} };
    for (auto& item : edit.value) {
        if (!id.empty() && item.id != id) continue;
        if (!is_challenge_kind(item.kind)) continue;
        std::string challenge = to_upper(item.challenge);
        std::string response = to_upper(item.response);
        if (challenge == item.challenge && response == item.response) continue;
        item.challenge = std::move(challenge);
        item.response = std::move(response);
        edit.applied = true;
    }
    if (!edit.applied) return unchanged(items);
    return edit;
}

} // namespace checklist
