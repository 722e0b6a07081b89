#pragma once

#include "checklist_engine/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace checklist {

// ID helpers
std::string make_new_id(IdSource& ids);
Checklist clone_with_fresh_ids(const Checklist& source, IdSource& ids);
// Moves the counter past every `prefix + N` id in `file`, so later ids never repeat one of them.
void reserve_ids(IdSource& ids, const File& file);
// Replaces every id in `file` that is empty or already in `taken`, then adds all of
// the file's ids to `taken`.
void replace_clashing_ids(File& file, std::unordered_set<std::string>& taken, IdSource& ids);

// Lookup helpers; nullptr / nullopt when the id does not resolve
File* find_file(std::vector<File>& files, const std::string& id);
const File* find_file(const std::vector<File>& files, const std::string& id);
Group* find_group(File& file, const std::string& id);
const Group* find_group(const File& file, const std::string& id);
Checklist* find_checklist(Group& group, const std::string& id);
const Checklist* find_checklist(const Group& group, const std::string& id);
Checklist* find_checklist(std::vector<File>& files, const ChecklistRef& ref);
const Checklist* find_checklist(const std::vector<File>& files, const ChecklistRef& ref);

std::optional<size_t> index_of_file(const std::vector<File>& files, const std::string& id);
std::optional<size_t> index_of_group(const File& file, const std::string& id);
std::optional<size_t> index_of_checklist(const Group& group, const std::string& id);

// Every item id currently present in the partition.
std::unordered_set<std::string> collect_item_ids(const std::vector<File>& files);
// Every file, group, checklist and item id in the partition.
std::unordered_set<std::string> collect_all_ids(const std::vector<File>& files);

// Container editing helper: splice the element at `from` so it lands at `to`.
// Returns false (leaving vec untouched) when either index is out of range or they are equal.
template <typename T>
bool move_element(std::vector<T>& vec, size_t from, size_t to) {
    if (from >= vec.size() || to >= vec.size() || from == to) return false;
    T moved = std::move(vec[from]);
    vec.erase(vec.begin() + static_cast<std::ptrdiff_t>(from));
    vec.insert(vec.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
    return true;
}

} // namespace checklist
