#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace checklist {

constexpr int kMinDepth = 0;
constexpr int kMaxDepth = 3;

enum class ItemKind {
    ChallengeResponse,
    ChallengeOnly,
    Title,
    Note,
    Warning,
    Caution
};

enum class GroupCategory {
    Normal,
    Emergency,
    Abnormal
};

// Source format tag carried through from whichever layer opened the file.
enum class FileFormat {
    Ace,
    Gplt,
    AfsDynon,
    ForeFlight,
    Grt,
    Json,
    Pdf
};

struct Item {
    std::string id;
    ItemKind kind = ItemKind::ChallengeResponse;
    std::string challenge;
    std::string response; // only meaningful for ChallengeResponse
    int depth = 0;        // 0..3; hierarchy is inferred from position + depth
    bool centered = false;
    bool collapsible = false;
};

struct Checklist {
    std::string id;
    std::string name;
    std::vector<Item> items; // ordered; the sole encoding of position
};

struct Group {
    std::string id;
    std::string name;
    GroupCategory category = GroupCategory::Normal;
    std::vector<Checklist> checklists;
};

struct FileMetadata {
    std::string aircraftRegistration;
    std::string makeModel;
    std::string copyright;
};

struct File {
    std::string id;
    std::string name;
    FileFormat format = FileFormat::Json;
    std::optional<std::string> path; // nullopt for files never saved
    FileMetadata metadata;
    std::vector<Group> groups;
    bool dirty = false;
};

// Addresses a single checklist inside the open files.
struct ChecklistRef {
    std::string fileId;
    std::string groupId;
    std::string checklistId;
};

// Partial update for update_item; unset fields are left alone.
struct ItemChanges {
    std::optional<ItemKind> kind;
    std::optional<std::string> challenge;
    std::optional<std::string> response;
    std::optional<int> depth;
    std::optional<bool> centered;
    std::optional<bool> collapsible;
};

// Partial update for update_file_metadata.
struct MetadataChanges {
    std::optional<std::string> aircraftRegistration;
    std::optional<std::string> makeModel;
    std::optional<std::string> copyright;
};

struct EngineOptions {
    size_t historyLimit = 0;       // 0 keeps every entry
    std::string idPrefix = "n";    // generated ids are idPrefix + counter
};

// Deterministic id generation: n1, n2, ...
struct IdSource {
    std::string prefix = "n";
    unsigned long long counter = 0;
};

bool operator==(const Item& a, const Item& b);
bool operator!=(const Item& a, const Item& b);
bool operator==(const Checklist& a, const Checklist& b);
bool operator!=(const Checklist& a, const Checklist& b);
bool operator==(const Group& a, const Group& b);
bool operator!=(const Group& a, const Group& b);
bool operator==(const FileMetadata& a, const FileMetadata& b);
bool operator!=(const FileMetadata& a, const FileMetadata& b);
bool operator==(const File& a, const File& b);
bool operator!=(const File& a, const File& b);

// Stable string tags for an external format layer.
const char* to_string(ItemKind kind);
const char* to_string(GroupCategory category);
const char* to_string(FileFormat format);
std::optional<ItemKind> parse_item_kind(const std::string& tag);
std::optional<GroupCategory> parse_group_category(const std::string& tag);
std::optional<FileFormat> parse_file_format(const std::string& tag);

inline bool is_valid_depth(int depth) { return depth >= kMinDepth && depth <= kMaxDepth; }

} // namespace checklist
