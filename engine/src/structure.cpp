#include "checklist_engine/structure.hpp"
#include "checklist_engine/state_utils.hpp"
#include <algorithm>
#include <utility>

namespace checklist {

static FilesEdit unchanged(const std::vector<File>& files) {
    return FilesEdit{ files, false, {} };
}

// Copies the partition, runs fn on the addressed file, keeps the copy only if fn reports a change.
template <typename Fn>
static FilesEdit mutate_file(const std::vector<File>& files, const std::string& fileId, Fn fn) {
    FilesEdit edit{ files, false, {} };
    File* file = find_file(edit.value, fileId);
    if (!file) return unchanged(files);
    edit.applied = fn(*file, edit.created);
    if (!edit.applied) return unchanged(files);
    return edit;
}

template <typename Fn>
static FilesEdit mutate_group(const std::vector<File>& files, const std::string& fileId,
                              const std::string& groupId, Fn fn) {
    return mutate_file(files, fileId, [&](File& file, std::vector<std::string>& created) {
        Group* group = find_group(file, groupId);
        return group != nullptr && fn(*group, created);
    });
}

static void insert_checklist(Group& group, Checklist checklist, std::optional<size_t> targetIndex) {
    const size_t at = targetIndex ? std::min(*targetIndex, group.checklists.size()) : group.checklists.size();
    group.checklists.insert(group.checklists.begin() + static_cast<std::ptrdiff_t>(at), std::move(checklist));
}

FilesEdit rename_file(const std::vector<File>& files, const std::string& fileId, const std::string& name) {
    return mutate_file(files, fileId, [&](File& file, std::vector<std::string>&) {
        if (file.name == name) return false;
        file.name = name;
        return true;
    });
}

FilesEdit update_file_metadata(const std::vector<File>& files, const std::string& fileId,
                               const MetadataChanges& changes) {
    return mutate_file(files, fileId, [&](File& file, std::vector<std::string>&) {
        FileMetadata updated = file.metadata;
        if (changes.aircraftRegistration) updated.aircraftRegistration = *changes.aircraftRegistration;
        if (changes.makeModel) updated.makeModel = *changes.makeModel;
        if (changes.copyright) updated.copyright = *changes.copyright;
        if (updated == file.metadata) return false;
        file.metadata = std::move(updated);
        return true;
    });
}

FilesEdit uppercase_file(const std::vector<File>& files, const std::string& fileId) {
    return mutate_file(files, fileId, [&](File& file, std::vector<std::string>&) {
        bool changed = false;
        for (auto& group : file.groups) {
            for (auto& cl : group.checklists) {
                ItemEdit e = uppercase_items(cl.items);
                if (!e.applied) continue;
                cl.items = std::move(e.value);
                changed = true;
            }
        }
        return changed;
    });
}

FilesEdit add_group(const std::vector<File>& files, const std::string& fileId, const std::string& name,
                    GroupCategory category, IdSource& ids) {
    return mutate_file(files, fileId, [&](File& file, std::vector<std::string>& created) {
        Group group;
        group.id = make_new_id(ids);
        group.name = name;
        group.category = category;
        created.push_back(group.id);
        file.groups.push_back(std::move(group));
        return true;
    });
}

FilesEdit remove_group(const std::vector<File>& files, const std::string& fileId, const std::string& groupId) {
    return mutate_file(files, fileId, [&](File& file, std::vector<std::string>&) {
        auto idx = index_of_group(file, groupId);
        if (!idx) return false;
        file.groups.erase(file.groups.begin() + static_cast<std::ptrdiff_t>(*idx));
        return true;
    });
}

FilesEdit rename_group(const std::vector<File>& files, const std::string& fileId, const std::string& groupId,
                       const std::string& name) {
    return mutate_group(files, fileId, groupId, [&](Group& group, std::vector<std::string>&) {
        if (group.name == name) return false;
        group.name = name;
        return true;
    });
}

FilesEdit set_group_category(const std::vector<File>& files, const std::string& fileId,
                             const std::string& groupId, GroupCategory category) {
    return mutate_group(files, fileId, groupId, [&](Group& group, std::vector<std::string>&) {
        if (group.category == category) return false;
        group.category = category;
        return true;
    });
}

FilesEdit reorder_groups(const std::vector<File>& files, const std::string& fileId, size_t fromIndex,
                         size_t toIndex) {
    return mutate_file(files, fileId, [&](File& file, std::vector<std::string>&) {
        return move_element(file.groups, fromIndex, toIndex);
    });
}

FilesEdit add_checklist(const std::vector<File>& files, const std::string& fileId, const std::string& groupId,
                        const std::string& name, IdSource& ids) {
    return mutate_group(files, fileId, groupId, [&](Group& group, std::vector<std::string>& created) {
        Checklist cl;
        cl.id = make_new_id(ids);
        cl.name = name;
        created.push_back(cl.id);
        group.checklists.push_back(std::move(cl));
        return true;
    });
}

FilesEdit remove_checklist(const std::vector<File>& files, const ChecklistRef& ref) {
    return mutate_group(files, ref.fileId, ref.groupId, [&](Group& group, std::vector<std::string>&) {
        auto idx = index_of_checklist(group, ref.checklistId);
        if (!idx) return false;
        group.checklists.erase(group.checklists.begin() + static_cast<std::ptrdiff_t>(*idx));
        return true;
    });
}

FilesEdit rename_checklist(const std::vector<File>& files, const ChecklistRef& ref, const std::string& name) {
    return mutate_group(files, ref.fileId, ref.groupId, [&](Group& group, std::vector<std::string>&) {
        Checklist* cl = find_checklist(group, ref.checklistId);
        if (!cl || cl->name == name) return false;
        cl->name = name;
        return true;
    });
}

FilesEdit duplicate_checklist(const std::vector<File>& files, const ChecklistRef& ref, IdSource& ids) {
    return mutate_group(files, ref.fileId, ref.groupId, [&](Group& group, std::vector<std::string>& created) {
        auto idx = index_of_checklist(group, ref.checklistId);
        if (!idx) return false;
        Checklist copy = clone_with_fresh_ids(group.checklists[*idx], ids);
        copy.name += " (Copy)";
        created.push_back(copy.id);
        insert_checklist(group, std::move(copy), *idx + 1);
        return true;
    });
}

FilesEdit import_checklists(const std::vector<File>& files, const std::string& fileId, const std::string& groupId,
                            const std::vector<Checklist>& checklists, IdSource& ids) {
    return mutate_group(files, fileId, groupId, [&](Group& group, std::vector<std::string>& created) {
        for (const auto& source : checklists) {
            Checklist copy = clone_with_fresh_ids(source, ids);
            created.push_back(copy.id);
            group.checklists.push_back(std::move(copy));
        }
        return !checklists.empty();
    });
}

FilesEdit reorder_checklists(const std::vector<File>& files, const std::string& fileId,
                             const std::string& groupId, size_t fromIndex, size_t toIndex) {
    return mutate_group(files, fileId, groupId, [&](Group& group, std::vector<std::string>&) {
        return move_element(group.checklists, fromIndex, toIndex);
    });
}

FilesEdit move_checklist(const std::vector<File>& files, const ChecklistRef& source,
                         const std::string& toFileId, const std::string& toGroupId,
                         std::optional<size_t> targetIndex) {
    FilesEdit edit{ files, false, {} };
    File* fromFile = find_file(edit.value, source.fileId);
    Group* fromGroup = fromFile ? find_group(*fromFile, source.groupId) : nullptr;
    File* toFile = find_file(edit.value, toFileId);
    Group* toGroup = toFile ? find_group(*toFile, toGroupId) : nullptr;
    if (!fromGroup || !toGroup) return unchanged(files);
    auto idx = index_of_checklist(*fromGroup, source.checklistId);
    if (!idx) return unchanged(files);

    Checklist moved = std::move(fromGroup->checklists[*idx]);
    fromGroup->checklists.erase(fromGroup->checklists.begin() + static_cast<std::ptrdiff_t>(*idx));
    insert_checklist(*toGroup, std::move(moved), targetIndex);
    if (fromGroup == toGroup && index_of_checklist(*toGroup, source.checklistId) == idx) {
        return unchanged(files); // dropped back where it was
    }
    edit.applied = true;
    return edit;
}

FilesEdit copy_checklist(const std::vector<File>& files, const ChecklistRef& source,
                         const std::string& toFileId, const std::string& toGroupId, IdSource& ids,
                         std::optional<size_t> targetIndex) {
    const Checklist* original = find_checklist(files, source);
    if (!original) return unchanged(files);
    Checklist copy = clone_with_fresh_ids(*original, ids);
    const std::string copyId = copy.id;
    FilesEdit edit = mutate_group(files, toFileId, toGroupId, [&](Group& group, std::vector<std::string>& created) {
        created.push_back(copyId);
        insert_checklist(group, std::move(copy), targetIndex);
        return true;
    });
    return edit;
}

FilesEdit replace_items(const std::vector<File>& files, const ChecklistRef& ref, const ItemEdit& edit) {
    if (!edit.applied) return unchanged(files);
    FilesEdit out{ files, false, edit.created };
    Checklist* cl = find_checklist(out.value, ref);
    if (!cl) return unchanged(files);
    cl->items = edit.value;
    out.applied = true;
    return out;
}

} // namespace checklist
