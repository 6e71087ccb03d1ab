#include "bridge/model/Entry.hpp"

#include <nlohmann/json.hpp>

namespace fb::bridge::model {

std::string to_string(const EntryKind kind) {
    return kind == EntryKind::Directory ? "directory" : "file";
}

void to_json(nlohmann::json& j, const DirectoryEntry& e) {
    j = {
        {"name", e.name},
        {"path", e.path},
        {"type", to_string(e.kind)},
        {"size", e.size},
        {"modified", e.modified},
        {"mimeType", e.mime_type}
    };
}

void to_json(nlohmann::json& j, const ReadResult& r) {
    j = {
        {"content", r.content},
        {"detectedEncoding", r.detected_encoding},
        {"mimeType", r.mime_type}
    };
}

void to_json(nlohmann::json& j, const WriteResult& r) {
    j = {{"status", r.status}};
}

void to_json(nlohmann::json& j, const UploadResult& r) {
    j = {{"url", r.url}};
}

}
