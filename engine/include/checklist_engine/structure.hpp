#pragma once

#include "checklist_engine/engine.hpp"
#include "checklist_engine/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace checklist {

using FilesEdit = Edit<std::vector<File>>;

// File level
FilesEdit rename_file(const std::vector<File>& files, const std::string& fileId, const std::string& name);
FilesEdit update_file_metadata(const std::vector<File>& files, const std::string& fileId,
                               const MetadataChanges& changes);
FilesEdit uppercase_file(const std::vector<File>& files, const std::string& fileId);

// Group level
FilesEdit add_group(const std::vector<File>& files, const std::string& fileId, const std::string& name,
                    GroupCategory category, IdSource& ids);
FilesEdit remove_group(const std::vector<File>& files, const std::string& fileId, const std::string& groupId);
FilesEdit rename_group(const std::vector<File>& files, const std::string& fileId, const std::string& groupId,
                       const std::string& name);
FilesEdit set_group_category(const std::vector<File>& files, const std::string& fileId,
                             const std::string& groupId, GroupCategory category);
FilesEdit reorder_groups(const std::vector<File>& files, const std::string& fileId, size_t fromIndex,
                         size_t toIndex);

// Checklist level
FilesEdit add_checklist(const std::vector<File>& files, const std::string& fileId, const std::string& groupId,
                        const std::string& name, IdSource& ids);
FilesEdit remove_checklist(const std::vector<File>& files, const ChecklistRef& ref);
FilesEdit rename_checklist(const std::vector<File>& files, const ChecklistRef& ref, const std::string& name);
// Inserts a " (Copy)" clone with fresh ids right after the source.
FilesEdit duplicate_checklist(const std::vector<File>& files, const ChecklistRef& ref, IdSource& ids);
// Appends clones (fresh ids) of externally supplied checklists to a group.
FilesEdit import_checklists(const std::vector<File>& files, const std::string& fileId, const std::string& groupId,
                            const std::vector<Checklist>& checklists, IdSource& ids);
FilesEdit reorder_checklists(const std::vector<File>& files, const std::string& fileId,
                             const std::string& groupId, size_t fromIndex, size_t toIndex);
// Relocates a checklist with its whole item sequence; appended when targetIndex is
// omitted or past the end. Works across groups and across files.
FilesEdit move_checklist(const std::vector<File>& files, const ChecklistRef& source,
                         const std::string& toFileId, const std::string& toGroupId,
                         std::optional<size_t> targetIndex = std::nullopt);
// Like move_checklist but leaves the source in place and gives the copy fresh ids.
FilesEdit copy_checklist(const std::vector<File>& files, const ChecklistRef& source,
                         const std::string& toFileId, const std::string& toGroupId, IdSource& ids,
                         std::optional<size_t> targetIndex = std::nullopt);

// Swaps a checklist's item sequence for the result of an item edit.
FilesEdit replace_items(const std::vector<File>& files, const ChecklistRef& ref, const ItemEdit& edit);

} // namespace checklist
