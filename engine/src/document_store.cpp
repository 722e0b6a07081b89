#include "checklist_engine/document_store.hpp"
#include "checklist_engine/engine.hpp"
#include "checklist_engine/hierarchy.hpp"
#include "checklist_engine/state_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace checklist {

DocumentStore::DocumentStore(EngineOptions options) : history_(options.historyLimit) {
    ids_.prefix = options.idPrefix;
}

bool DocumentStore::commit(FilesEdit edit, const std::vector<std::string>& touchedFiles, const char* what) {
    if (!edit.applied) {
        spdlog::debug("{}: refused", what);
        return false;
    }
    for (const auto& fileId : touchedFiles) {
        if (File* f = find_file(edit.value, fileId)) f->dirty = true;
    }
    History::Snapshot before = std::move(files_);
    files_ = std::move(edit.value);
    history_.commit(std::move(before), files_);
    revalidate();
    spdlog::debug("{}: committed", what);
    return true;
}

bool DocumentStore::commit_items(const ChecklistRef& ref, const ItemEdit& edit, const char* what) {
    return commit(replace_items(files_, ref, edit), { ref.fileId }, what);
}

const std::vector<Item>* DocumentStore::items_of(const ChecklistRef& ref) const {
    const Checklist* cl = find_checklist(files_, ref);
    return cl ? &cl->items : nullptr;
}

// Drops every transient reference the last data change invalidated.
void DocumentStore::revalidate() {
    const auto existing = collect_item_ids(files_);
    selection_.retain(existing);
    for (auto it = collapsed_.begin(); it != collapsed_.end();) {
        if (existing.count(*it)) ++it;
        else it = collapsed_.erase(it);
    }
    if (activeChecklist_ && !find_checklist(files_, *activeChecklist_)) {
        activeChecklist_.reset();
        selection_.clear();
    }
    if (!activeFileId_.empty() && !find_file(files_, activeFileId_)) {
        activeFileId_ = files_.empty() ? std::string() : files_.front().id;
    }
}

// -- Files

std::string DocumentStore::create_file(const std::string& name, FileFormat format) {
    File f;
    f.name = name;
    f.format = format;
    return open_file(std::move(f));
}

std::string DocumentStore::open_file(File file) {
    reserve_ids(ids_, file);
    auto taken = collect_all_ids(files_);
    replace_clashing_ids(file, taken, ids_);
    const std::string id = file.id;
    FilesEdit edit{ files_, true, { id } };
    edit.value.push_back(std::move(file));
    if (!commit(std::move(edit), {}, "open_file")) return std::string();
    activeFileId_ = id;
    return id;
}

bool DocumentStore::close_file(const std::string& fileId) {
    auto idx = index_of_file(files_, fileId);
    if (!idx) {
        spdlog::debug("close_file: unknown file {}", fileId);
        return false;
    }
    FilesEdit edit{ files_, true, {} };
    edit.value.erase(edit.value.begin() + static_cast<std::ptrdiff_t>(*idx));
    if (activeFileId_ == fileId) {
        activeChecklist_.reset();
        selection_.clear();
    }
    return commit(std::move(edit), {}, "close_file");
}

const File* DocumentStore::file(const std::string& fileId) const {
    return find_file(files_, fileId);
}

const Checklist* DocumentStore::checklist(const ChecklistRef& ref) const {
    return find_checklist(files_, ref);
}

bool DocumentStore::is_dirty(const std::string& fileId) const {
    const File* f = find_file(files_, fileId);
    return f && f->dirty;
}

void DocumentStore::mark_clean(const std::string& fileId) {
    if (File* f = find_file(files_, fileId)) f->dirty = false;
}

bool DocumentStore::rename_file(const std::string& fileId, const std::string& name) {
    return commit(checklist::rename_file(files_, fileId, name), { fileId }, "rename_file");
}

bool DocumentStore::update_file_metadata(const std::string& fileId, const MetadataChanges& changes) {
    return commit(checklist::update_file_metadata(files_, fileId, changes), { fileId }, "update_file_metadata");
}

bool DocumentStore::uppercase_file(const std::string& fileId) {
    return commit(checklist::uppercase_file(files_, fileId), { fileId }, "uppercase_file");
}

void DocumentStore::set_active_file(const std::string& fileId) {
    if (!fileId.empty() && !find_file(files_, fileId)) return;
    activeFileId_ = fileId;
    activeChecklist_.reset();
    selection_.clear();
}

// -- Groups

std::string DocumentStore::add_group(const std::string& fileId, const std::string& name, GroupCategory category) {
    FilesEdit edit = checklist::add_group(files_, fileId, name, category, ids_);
    std::string id = edit.created.empty() ? std::string() : edit.created.front();
    return commit(std::move(edit), { fileId }, "add_group") ? id : std::string();
}

bool DocumentStore::remove_group(const std::string& fileId, const std::string& groupId) {
    return commit(checklist::remove_group(files_, fileId, groupId), { fileId }, "remove_group");
}

bool DocumentStore::rename_group(const std::string& fileId, const std::string& groupId, const std::string& name) {
    return commit(checklist::rename_group(files_, fileId, groupId, name), { fileId }, "rename_group");
}

bool DocumentStore::set_group_category(const std::string& fileId, const std::string& groupId, GroupCategory category) {
    return commit(checklist::set_group_category(files_, fileId, groupId, category), { fileId }, "set_group_category");
}

bool DocumentStore::reorder_groups(const std::string& fileId, size_t fromIndex, size_t toIndex) {
    return commit(checklist::reorder_groups(files_, fileId, fromIndex, toIndex), { fileId }, "reorder_groups");
}

// -- Checklists

std::string DocumentStore::add_checklist(const std::string& fileId, const std::string& groupId, const std::string& name) {
    FilesEdit edit = checklist::add_checklist(files_, fileId, groupId, name, ids_);
    std::string id = edit.created.empty() ? std::string() : edit.created.front();
    return commit(std::move(edit), { fileId }, "add_checklist") ? id : std::string();
}

bool DocumentStore::remove_checklist(const ChecklistRef& ref) {
    return commit(checklist::remove_checklist(files_, ref), { ref.fileId }, "remove_checklist");
}

bool DocumentStore::rename_checklist(const ChecklistRef& ref, const std::string& name) {
    return commit(checklist::rename_checklist(files_, ref, name), { ref.fileId }, "rename_checklist");
}

std::string DocumentStore::duplicate_checklist(const ChecklistRef& ref) {
    FilesEdit edit = checklist::duplicate_checklist(files_, ref, ids_);
    std::string id = edit.created.empty() ? std::string() : edit.created.front();
    return commit(std::move(edit), { ref.fileId }, "duplicate_checklist") ? id : std::string();
}

std::vector<std::string> DocumentStore::import_checklists(const std::string& fileId, const std::string& groupId,
                                                          const std::vector<Checklist>& checklists) {
    FilesEdit edit = checklist::import_checklists(files_, fileId, groupId, checklists, ids_);
    std::vector<std::string> created = edit.created;
    if (!commit(std::move(edit), { fileId }, "import_checklists")) return {};
    return created;
}

bool DocumentStore::reorder_checklists(const std::string& fileId, const std::string& groupId, size_t fromIndex,
                                       size_t toIndex) {
    return commit(checklist::reorder_checklists(files_, fileId, groupId, fromIndex, toIndex), { fileId },
                  "reorder_checklists");
}

bool DocumentStore::move_checklist(const ChecklistRef& source, const std::string& toFileId,
                                   const std::string& toGroupId, std::optional<size_t> targetIndex) {
    if (!commit(checklist::move_checklist(files_, source, toFileId, toGroupId, targetIndex),
                { source.fileId, toFileId }, "move_checklist")) {
        return false;
    }
    // keep following the checklist if it was the one being edited
    if (activeChecklist_ && activeChecklist_->fileId == source.fileId &&
        activeChecklist_->groupId == source.groupId && activeChecklist_->checklistId == source.checklistId) {
        activeChecklist_ = ChecklistRef{ toFileId, toGroupId, source.checklistId };
    }
    return true;
}

std::string DocumentStore::copy_checklist(const ChecklistRef& source, const std::string& toFileId,
                                          const std::string& toGroupId, std::optional<size_t> targetIndex) {
    FilesEdit edit = checklist::copy_checklist(files_, source, toFileId, toGroupId, ids_, targetIndex);
    std::string id = edit.created.empty() ? std::string() : edit.created.front();
    return commit(std::move(edit), { toFileId }, "copy_checklist") ? id : std::string();
}

void DocumentStore::set_active_checklist(const ChecklistRef& ref) {
    if (!find_checklist(files_, ref)) return;
    activeFileId_ = ref.fileId;
    activeChecklist_ = ref;
    selection_.clear();
}

// -- Items

std::string DocumentStore::insert_item(const ChecklistRef& ref, ItemKind kind, std::optional<size_t> afterIndex) {
    const auto* items = items_of(ref);
    if (!items) return std::string();
    ItemEdit edit = checklist::insert_item(*items, kind, afterIndex, ids_);
    if (!commit_items(ref, edit, "insert_item")) return std::string();
    selection_.select_single(edit.created.front());
    return edit.created.front();
}

bool DocumentStore::remove_item(const ChecklistRef& ref, const std::string& targetId) {
    const auto* items = items_of(ref);
    if (!items) return false;
    const auto scope = selection_.resolve_scope(targetId);
    ItemEdit edit = scope.size() > 1 ? remove_items(*items, scope) : checklist::remove_item(*items, targetId);
    if (!edit.applied) return commit_items(ref, edit, "remove_item");
    std::unordered_set<std::string> kept;
    for (const auto& it : edit.value) kept.insert(it.id);
    std::vector<std::string> removed;
    for (const auto& it : *items) {
        if (!kept.count(it.id)) removed.push_back(it.id);
    }
    selection_.forget(removed);
    for (const auto& id : removed) collapsed_.erase(id);
    return commit_items(ref, edit, "remove_item");
}

std::vector<std::string> DocumentStore::duplicate_item(const ChecklistRef& ref, const std::string& targetId) {
    const auto* items = items_of(ref);
    if (!items) return {};
    const auto scope = selection_.resolve_scope(targetId);
    ItemEdit edit = scope.size() > 1 ? duplicate_items(*items, scope, ids_)
                                     : checklist::duplicate_item(*items, targetId, ids_);
    if (!commit_items(ref, edit, "duplicate_item")) return {};
    selection_.select_many(edit.created, edit.created.front());
    return edit.created;
}

bool DocumentStore::move_item(const ChecklistRef& ref, const std::string& targetId, size_t toIndex) {
    const auto* items = items_of(ref);
    if (!items) return false;
    const auto scope = selection_.resolve_scope(targetId);
    if (scope.size() > 1) {
        return commit_items(ref, reorder_items(*items, scope, toIndex), "move_item");
    }
    auto from = index_of(*items, targetId);
    if (!from) {
        spdlog::debug("move_item: unknown item {}", targetId);
        return false;
    }
    // past the end lands last, as a batch move does
    const size_t to = std::min(toIndex, items->size() - 1);
    return commit_items(ref, checklist::reorder_item(*items, *from, to), "move_item");
}

bool DocumentStore::reorder_item(const ChecklistRef& ref, size_t fromIndex, size_t toIndex) {
    const auto* items = items_of(ref);
    if (!items) return false;
    return commit_items(ref, checklist::reorder_item(*items, fromIndex, toIndex), "reorder_item");
}

bool DocumentStore::set_depth(const ChecklistRef& ref, const std::string& itemId, int delta) {
    const auto* items = items_of(ref);
    if (!items) return false;
    return commit_items(ref, checklist::set_depth(*items, itemId, delta), "set_depth");
}

bool DocumentStore::update_item(const ChecklistRef& ref, const std::string& itemId, const ItemChanges& changes) {
    const auto* items = items_of(ref);
    if (!items) return false;
    return commit_items(ref, checklist::update_item(*items, itemId, changes), "update_item");
}

bool DocumentStore::uppercase_item(const ChecklistRef& ref, const std::string& itemId) {
    const auto* items = items_of(ref);
    if (!items || itemId.empty()) return false;
    return commit_items(ref, uppercase_items(*items, itemId), "uppercase_item");
}

bool DocumentStore::uppercase_checklist(const ChecklistRef& ref) {
    const auto* items = items_of(ref);
    if (!items) return false;
    return commit_items(ref, uppercase_items(*items), "uppercase_checklist");
}

// -- Hierarchy queries

size_t DocumentStore::child_count(const ChecklistRef& ref, size_t index) const {
    const auto* items = items_of(ref);
    return items ? checklist::child_count(*items, index) : 0;
}

std::vector<size_t> DocumentStore::visible_indices(const ChecklistRef& ref) const {
    const auto* items = items_of(ref);
    if (!items) return {};
    return checklist::visible_indices(*items, collapsed_);
}

std::vector<std::string> DocumentStore::visible_ids(const ChecklistRef& ref) const {
    const auto* items = items_of(ref);
    if (!items) return {};
    return checklist::visible_ids(*items, collapsed_);
}

void DocumentStore::toggle_collapsed(const std::string& itemId) {
    if (collapsed_.erase(itemId)) return;
    if (!collect_item_ids(files_).count(itemId)) return;
    collapsed_.insert(itemId);
}

// -- Selection

void DocumentStore::select_item(const std::string& itemId) {
    if (!itemId.empty() && !collect_item_ids(files_).count(itemId)) return;
    selection_.select_single(itemId);
}

void DocumentStore::select_range(const ChecklistRef& ref, const std::string& targetId) {
    const auto* items = items_of(ref);
    if (!items || !index_of(*items, targetId)) return;
    selection_.select_range(targetId, checklist::visible_ids(*items, collapsed_));
}

void DocumentStore::clear_selection() {
    selection_.clear();
}

// -- History

bool DocumentStore::undo() {
    auto snapshot = history_.undo();
    if (!snapshot) return false;
    files_ = std::move(*snapshot);
    revalidate();
    return true;
}

bool DocumentStore::redo() {
    auto snapshot = history_.redo();
    if (!snapshot) return false;
    files_ = std::move(*snapshot);
    revalidate();
    return true;
}

} // namespace checklist
