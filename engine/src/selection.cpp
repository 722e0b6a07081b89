#include "checklist_engine/selection.hpp"
#include <algorithm>
#include <utility>

namespace checklist {

void Selection::select_single(const std::string& id) {
    activeId_ = id;
    selectedIds_.clear();
    if (!id.empty()) selectedIds_.insert(id);
}

void Selection::select_range(const std::string& targetId, const std::vector<std::string>& visibleIds) {
    if (targetId.empty()) return;
    const std::string anchorId = activeId_.empty() ? targetId : activeId_;
    auto anchorIt = std::find(visibleIds.begin(), visibleIds.end(), anchorId);
    auto targetIt = std::find(visibleIds.begin(), visibleIds.end(), targetId);
    activeId_ = targetId;
    selectedIds_.clear();
    if (anchorIt == visibleIds.end() || targetIt == visibleIds.end()) {
        selectedIds_.insert(targetId);
        return;
    }
    if (targetIt < anchorIt) std::swap(anchorIt, targetIt);
    selectedIds_.insert(anchorIt, targetIt + 1);
}

void Selection::select_many(const std::vector<std::string>& ids, const std::string& activeId) {
    selectedIds_ = std::set<std::string>(ids.begin(), ids.end());
    activeId_ = activeId;
    if (!activeId_.empty()) selectedIds_.insert(activeId_);
}

void Selection::clear() {
    activeId_.clear();
    selectedIds_.clear();
}

std::vector<std::string> Selection::resolve_scope(const std::string& targetId) const {
    if (selectedIds_.size() > 1 && selectedIds_.count(targetId)) {
        return std::vector<std::string>(selectedIds_.begin(), selectedIds_.end());
    }
    return { targetId };
}

void Selection::forget(const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        selectedIds_.erase(id);
        if (activeId_ == id) activeId_.clear();
    }
}

void Selection::retain(const std::unordered_set<std::string>& existingIds) {
    for (auto it = selectedIds_.begin(); it != selectedIds_.end();) {
        if (existingIds.count(*it)) ++it;
        else it = selectedIds_.erase(it);
    }
    if (!activeId_.empty() && !existingIds.count(activeId_)) activeId_.clear();
}

} // namespace checklist
