#include "checklist_engine/types.hpp"

namespace checklist {

bool operator==(const Item& a, const Item& b) {
    return a.id == b.id && a.kind == b.kind && a.challenge == b.challenge &&
           a.response == b.response && a.depth == b.depth &&
           a.centered == b.centered && a.collapsible == b.collapsible;
}
bool operator!=(const Item& a, const Item& b) { return !(a == b); }

bool operator==(const Checklist& a, const Checklist& b) {
    return a.id == b.id && a.name == b.name && a.items == b.items;
}
bool operator!=(const Checklist& a, const Checklist& b) { return !(a == b); }

bool operator==(const Group& a, const Group& b) {
    return a.id == b.id && a.name == b.name && a.category == b.category &&
           a.checklists == b.checklists;
}
bool operator!=(const Group& a, const Group& b) { return !(a == b); }

bool operator==(const FileMetadata& a, const FileMetadata& b) {
    return a.aircraftRegistration == b.aircraftRegistration &&
           a.makeModel == b.makeModel && a.copyright == b.copyright;
}
bool operator!=(const FileMetadata& a, const FileMetadata& b) { return !(a == b); }

bool operator==(const File& a, const File& b) {
    return a.id == b.id && a.name == b.name && a.format == b.format &&
           a.path == b.path && a.metadata == b.metadata && a.groups == b.groups &&
           a.dirty == b.dirty;
}
bool operator!=(const File& a, const File& b) { return !(a == b); }

const char* to_string(ItemKind kind) {
    switch (kind) {
        case ItemKind::ChallengeResponse: return "challenge_response";
        case ItemKind::ChallengeOnly: return "challenge_only";
        case ItemKind::Title: return "title";
        case ItemKind::Note: return "note";
        case ItemKind::Warning: return "warning";
        case ItemKind::Caution: return "caution";
    }
    return "challenge_response";
}

const char* to_string(GroupCategory category) {
    switch (category) {
        case GroupCategory::Normal: return "normal";
        case GroupCategory::Emergency: return "emergency";
        case GroupCategory::Abnormal: return "abnormal";
    }
    return "normal";
}

const char* to_string(FileFormat format) {
    switch (format) {
        case FileFormat::Ace: return "ace";
        case FileFormat::Gplt: return "gplt";
        case FileFormat::AfsDynon: return "afs_dynon";
        case FileFormat::ForeFlight: return "foreflight";
        case FileFormat::Grt: return "grt";
        case FileFormat::Json: return "json";
        case FileFormat::Pdf: return "pdf";
    }
    return "json";
}

std::optional<ItemKind> parse_item_kind(const std::string& tag) {
    for (auto kind : { ItemKind::ChallengeResponse, ItemKind::ChallengeOnly, ItemKind::Title,
                       ItemKind::Note, ItemKind::Warning, ItemKind::Caution }) {
        if (tag == to_string(kind)) return kind;
    }
    return std::nullopt;
}

std::optional<GroupCategory> parse_group_category(const std::string& tag) {
    for (auto category : { GroupCategory::Normal, GroupCategory::Emergency, GroupCategory::Abnormal }) {
        if (tag == to_string(category)) return category;
    }
    return std::nullopt;
}

std::optional<FileFormat> parse_file_format(const std::string& tag) {
    for (auto format : { FileFormat::Ace, FileFormat::Gplt, FileFormat::AfsDynon, FileFormat::ForeFlight,
                         FileFormat::Grt, FileFormat::Json, FileFormat::Pdf }) {
        if (tag == to_string(format)) return format;
    }
    return std::nullopt;
}

} // namespace checklist
