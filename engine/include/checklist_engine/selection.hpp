#pragma once

#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace checklist {

// Active item plus an optional multi-item selection. Holds ids only; the owner
// is responsible for calling retain()/forget() when items disappear.
class Selection {
public:
    // Sets the active item and collapses the selection to it; an empty id clears.
    void select_single(const std::string& id);

    // Selects the inclusive span between the previous active item (or targetId when
    // none) and targetId within visibleIds. Hidden items can never be selected this
    // way. targetId is always the active item afterwards.
    void select_range(const std::string& targetId, const std::vector<std::string>& visibleIds);

    // Replaces the selection wholesale, e.g. with freshly duplicated items.
    void select_many(const std::vector<std::string>& ids, const std::string& activeId);

    void clear();

    // The operand set of a batch-capable command started from targetId: the whole
    // selection when targetId belongs to a selection of more than one item,
    // otherwise just targetId.
    std::vector<std::string> resolve_scope(const std::string& targetId) const;

    void forget(const std::vector<std::string>& ids);
    void retain(const std::unordered_set<std::string>& existingIds);

    const std::string& active() const { return activeId_; }
    bool has_active() const { return !activeId_.empty(); }
    const std::set<std::string>& selected() const { return selectedIds_; }
    bool is_selected(const std::string& id) const { return selectedIds_.count(id) != 0; }
    size_t size() const { return selectedIds_.size(); }

private:
    std::string activeId_;
    std::set<std::string> selectedIds_;
};

} // namespace checklist
