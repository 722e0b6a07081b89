#include "checklist_engine/state_utils.hpp"
#include <algorithm>
#include <cctype>

namespace checklist {

std::string make_new_id(IdSource& ids) {
    ++ids.counter;
    return ids.prefix + std::to_string(ids.counter);
}

Checklist clone_with_fresh_ids(const Checklist& source, IdSource& ids) {
    Checklist copy = source;
    copy.id = make_new_id(ids);
    for (auto& item : copy.items) {
        item.id = make_new_id(ids);
    }
    return copy;
}

static void reserve_id(IdSource& ids, const std::string& id) {
    if (id.size() <= ids.prefix.size() || id.compare(0, ids.prefix.size(), ids.prefix) != 0) return;
    const std::string digits = id.substr(ids.prefix.size());
    if (digits.size() > 18) return;
    for (char ch : digits) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return;
    }
    const unsigned long long n = std::stoull(digits);
    if (n > ids.counter) ids.counter = n;
}

void reserve_ids(IdSource& ids, const File& file) {
    reserve_id(ids, file.id);
    for (const auto& group : file.groups) {
        reserve_id(ids, group.id);
        for (const auto& cl : group.checklists) {
            reserve_id(ids, cl.id);
            for (const auto& item : cl.items) reserve_id(ids, item.id);
        }
    }
}

static void claim_id(std::string& id, std::unordered_set<std::string>& taken, IdSource& ids) {
    if (id.empty() || taken.count(id)) id = make_new_id(ids);
    taken.insert(id);
}

void replace_clashing_ids(File& file, std::unordered_set<std::string>& taken, IdSource& ids) {
    claim_id(file.id, taken, ids);
    for (auto& group : file.groups) {
        claim_id(group.id, taken, ids);
        for (auto& cl : group.checklists) {
            claim_id(cl.id, taken, ids);
            for (auto& item : cl.items) claim_id(item.id, taken, ids);
        }
    }
}

template <typename Vec>
static auto find_by_id(Vec& vec, const std::string& id) -> decltype(&vec.front()) {
    auto it = std::find_if(vec.begin(), vec.end(), [&](const auto& e) { return e.id == id; });
    return it == vec.end() ? nullptr : &*it;
}

template <typename Vec>
static std::optional<size_t> position_by_id(const Vec& vec, const std::string& id) {
    auto it = std::find_if(vec.begin(), vec.end(), [&](const auto& e) { return e.id == id; });
    if (it == vec.end()) return std::nullopt;
    return static_cast<size_t>(std::distance(vec.begin(), it));
}

File* find_file(std::vector<File>& files, const std::string& id) { return find_by_id(files, id); }
const File* find_file(const std::vector<File>& files, const std::string& id) { return find_by_id(files, id); }
Group* find_group(File& file, const std::string& id) { return find_by_id(file.groups, id); }
const Group* find_group(const File& file, const std::string& id) { return find_by_id(file.groups, id); }
Checklist* find_checklist(Group& group, const std::string& id) { return find_by_id(group.checklists, id); }
const Checklist* find_checklist(const Group& group, const std::string& id) { return find_by_id(group.checklists, id); }

Checklist* find_checklist(std::vector<File>& files, const ChecklistRef& ref) {
    File* file = find_file(files, ref.fileId);
    if (!file) return nullptr;
    Group* group = find_group(*file, ref.groupId);
    if (!group) return nullptr;
    return find_checklist(*group, ref.checklistId);
}

const Checklist* find_checklist(const std::vector<File>& files, const ChecklistRef& ref) {
    const File* file = find_file(files, ref.fileId);
    if (!file) return nullptr;
    const Group* group = find_group(*file, ref.groupId);
    if (!group) return nullptr;
    return find_checklist(*group, ref.checklistId);
}

std::optional<size_t> index_of_file(const std::vector<File>& files, const std::string& id) {
    return position_by_id(files, id);
}

std::optional<size_t> index_of_group(const File& file, const std::string& id) {
    return position_by_id(file.groups, id);
}

std::optional<size_t> index_of_checklist(const Group& group, const std::string& id) {
    return position_by_id(group.checklists, id);
}

std::unordered_set<std::string> collect_item_ids(const std::vector<File>& files) {
    std::unordered_set<std::string> out;
    for (const auto& file : files) {
        for (const auto& group : file.groups) {
            for (const auto& cl : group.checklists) {
                for (const auto& item : cl.items) out.insert(item.id);
            }
        }
    }
    return out;
}

std::unordered_set<std::string> collect_all_ids(const std::vector<File>& files) {
    std::unordered_set<std::string> out;
    for (const auto& file : files) {
        out.insert(file.id);
        for (const auto& group : file.groups) {
            out.insert(group.id);
            for (const auto& cl : group.checklists) {
                out.insert(cl.id);
                for (const auto& item : cl.items) out.insert(item.id);
            }
        }
    }
    return out;
}

} // namespace checklist
