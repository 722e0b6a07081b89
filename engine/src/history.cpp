#include "checklist_engine/history.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <utility>

namespace checklist {

void History::commit(Snapshot before, Snapshot after) {
    if (cursor_ < entries_.size()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(cursor_), entries_.end());
    }
    if (entries_.empty()) base_ = std::move(before);
    entries_.push_back(std::move(after));
    if (limit_ > 0 && entries_.size() > limit_) {
        const size_t dropped = entries_.size() - limit_;
        base_ = std::move(entries_[dropped - 1]);
        entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(dropped));
    }
    cursor_ = entries_.size();
    spdlog::debug("history: commit, {} entries", entries_.size());
}

std::optional<History::Snapshot> History::undo() {
    if (!can_undo()) return std::nullopt;
    --cursor_;
    spdlog::trace("history: undo to {}", cursor_);
    return cursor_ == 0 ? base_ : entries_[cursor_ - 1];
}

std::optional<History::Snapshot> History::redo() {
    if (!can_redo()) return std::nullopt;
    spdlog::trace("history: redo to {}", cursor_ + 1);
    return entries_[cursor_++];
}

void History::clear() {
    base_.clear();
    entries_.clear();
    cursor_ = 0;
}

} // namespace checklist
