#pragma once

#include "checklist_engine/history.hpp"
#include "checklist_engine/selection.hpp"
#include "checklist_engine/structure.hpp"
#include "checklist_engine/types.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace checklist {

// Owns the open files together with their editing state. Every mutation goes
// through here: the engine computes the new value, the store swaps it in, marks
// the touched file dirty, records one history entry and drops selection/collapse
// references to items that no longer exist.
//
// Mutators return false / an empty id when the edit was refused (unknown id,
// index out of range, depth boundary, nothing to change). Nothing throws.
class DocumentStore {
public:
    explicit DocumentStore(EngineOptions options = EngineOptions());

    // -- Files
    std::string create_file(const std::string& name, FileFormat format = FileFormat::Json);
    // Takes a file handed over by a format layer. Any file, group, checklist or item id
    // that is missing or already open is replaced, and the id counter skips past the
    // file's own generated ids.
    std::string open_file(File file);
    bool close_file(const std::string& fileId);
    const std::vector<File>& files() const { return files_; }
    const File* file(const std::string& fileId) const;
    const Checklist* checklist(const ChecklistRef& ref) const;
    bool is_dirty(const std::string& fileId) const;
    // Called by the save path; not an undoable edit.
    void mark_clean(const std::string& fileId);
    bool rename_file(const std::string& fileId, const std::string& name);
    bool update_file_metadata(const std::string& fileId, const MetadataChanges& changes);
    bool uppercase_file(const std::string& fileId);
    void set_active_file(const std::string& fileId);
    const std::string& active_file() const { return activeFileId_; }

    // -- Groups
    std::string add_group(const std::string& fileId, const std::string& name, GroupCategory category);
    bool remove_group(const std::string& fileId, const std::string& groupId);
    bool rename_group(const std::string& fileId, const std::string& groupId, const std::string& name);
    bool set_group_category(const std::string& fileId, const std::string& groupId, GroupCategory category);
    bool reorder_groups(const std::string& fileId, size_t fromIndex, size_t toIndex);

    // -- Checklists
    std::string add_checklist(const std::string& fileId, const std::string& groupId, const std::string& name);
    bool remove_checklist(const ChecklistRef& ref);
    bool rename_checklist(const ChecklistRef& ref, const std::string& name);
    std::string duplicate_checklist(const ChecklistRef& ref);
    std::vector<std::string> import_checklists(const std::string& fileId, const std::string& groupId,
                                               const std::vector<Checklist>& checklists);
    bool reorder_checklists(const std::string& fileId, const std::string& groupId, size_t fromIndex,
                            size_t toIndex);
    bool move_checklist(const ChecklistRef& source, const std::string& toFileId, const std::string& toGroupId,
                        std::optional<size_t> targetIndex = std::nullopt);
    std::string copy_checklist(const ChecklistRef& source, const std::string& toFileId,
                               const std::string& toGroupId, std::optional<size_t> targetIndex = std::nullopt);
    void set_active_checklist(const ChecklistRef& ref);
    const std::optional<ChecklistRef>& active_checklist() const { return activeChecklist_; }

    // -- Items. remove_item, duplicate_item and move_item act on the whole
    // selection when targetId is part of a multi-selection. move_item clamps
    // toIndex to the end in both cases.
    std::string insert_item(const ChecklistRef& ref, ItemKind kind, std::optional<size_t> afterIndex = std::nullopt);
    bool remove_item(const ChecklistRef& ref, const std::string& targetId);
    std::vector<std::string> duplicate_item(const ChecklistRef& ref, const std::string& targetId);
    bool move_item(const ChecklistRef& ref, const std::string& targetId, size_t toIndex);
    bool reorder_item(const ChecklistRef& ref, size_t fromIndex, size_t toIndex);
    bool set_depth(const ChecklistRef& ref, const std::string& itemId, int delta);
    bool indent_item(const ChecklistRef& ref, const std::string& itemId) { return set_depth(ref, itemId, +1); }
    bool outdent_item(const ChecklistRef& ref, const std::string& itemId) { return set_depth(ref, itemId, -1); }
    bool update_item(const ChecklistRef& ref, const std::string& itemId, const ItemChanges& changes);
    bool uppercase_item(const ChecklistRef& ref, const std::string& itemId);
    bool uppercase_checklist(const ChecklistRef& ref);

    // -- Hierarchy queries over the current value
    size_t child_count(const ChecklistRef& ref, size_t index) const;
    std::vector<size_t> visible_indices(const ChecklistRef& ref) const;
    std::vector<std::string> visible_ids(const ChecklistRef& ref) const;
    void toggle_collapsed(const std::string& itemId);
    bool is_collapsed(const std::string& itemId) const { return collapsed_.count(itemId) != 0; }
    const std::unordered_set<std::string>& collapsed() const { return collapsed_; }

    // -- Selection
    void select_item(const std::string& itemId);
    void select_range(const ChecklistRef& ref, const std::string& targetId);
    void clear_selection();
    const Selection& selection() const { return selection_; }

    // -- History
    bool undo();
    bool redo();
    bool can_undo() const { return history_.can_undo(); }
    bool can_redo() const { return history_.can_redo(); }
    const History& history() const { return history_; }

private:
    bool commit(FilesEdit edit, const std::vector<std::string>& touchedFiles, const char* what);
    bool commit_items(const ChecklistRef& ref, const ItemEdit& edit, const char* what);
    const std::vector<Item>* items_of(const ChecklistRef& ref) const;
    void revalidate();

    std::vector<File> files_;
    std::string activeFileId_;
    std::optional<ChecklistRef> activeChecklist_;
    Selection selection_;
    std::unordered_set<std::string> collapsed_;
    History history_;
    IdSource ids_;
};

} // namespace checklist
