#pragma once

#include <optional>
#include <string>

namespace fb::fs {

enum class FileClass { Text, Binary };

// Extension based, case-insensitive. Anything not on the text list is binary.
[[nodiscard]] FileClass classify(const std::string& path);

[[nodiscard]] inline bool isTextFile(const std::string& path) { return classify(path) == FileClass::Text; }

// std::nullopt when the extension is not known.
[[nodiscard]] std::optional<std::string> guessMimeType(const std::string& path);

}
