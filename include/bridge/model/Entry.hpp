#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fb::bridge::model {

enum class EntryKind { File, Directory };

struct DirectoryEntry {
    std::string name, path;
    EntryKind kind{EntryKind::File};
    uintmax_t size{0};
    std::string modified;
    std::string mime_type;     // empty when unknown
};

struct ReadResult {
    std::string content;            // decoded text, or base64 for binary files
    std::string detected_encoding;  // canonical encoding name, or "binary"
    std::string mime_type;
};

struct WriteResult {
    std::string status = "ok";
};

struct UploadResult {
    std::string url;
};

[[nodiscard]] std::string to_string(EntryKind kind);

void to_json(nlohmann::json& j, const DirectoryEntry& e);
void to_json(nlohmann::json& j, const ReadResult& r);
void to_json(nlohmann::json& j, const WriteResult& r);
void to_json(nlohmann::json& j, const UploadResult& r);

}
