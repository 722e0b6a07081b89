#pragma once

#include "checklist_engine/types.hpp"
#include <optional>
#include <vector>

namespace checklist {

// Snapshot history of the document partition (files -> groups -> checklists ->
// items). Selection, collapse state and the like are never recorded here.
class History {
public:
    using Snapshot = std::vector<File>;

    explicit History(size_t limit = 0) : limit_(limit) {}

    // Records one completed mutation. `before` must be the value at the cursor; it is
    // only kept when nothing earlier is. Discards anything that could have been redone.
    void commit(Snapshot before, Snapshot after);

    // Each returns the value to restore, or nullopt when there is nothing to step to.
    std::optional<Snapshot> undo();
    std::optional<Snapshot> redo();

    bool can_undo() const { return cursor_ > 0; }
    bool can_redo() const { return cursor_ < entries_.size(); }
    size_t size() const { return entries_.size(); }
    size_t cursor() const { return cursor_; }
    void clear();

private:
    // entries_[i] is the value after commit i; the value before entries_[0] is base_.
    Snapshot base_;
    std::vector<Snapshot> entries_;
    size_t cursor_ = 0; // entries_[0, cursor_) are undoable
    size_t limit_ = 0;
};

} // namespace checklist
