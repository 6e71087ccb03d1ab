#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fb::encoding {

// Declarations are only looked for in this many leading bytes.
constexpr size_t DECLARATION_SCAN_BYTES = 4096;

enum class Source { Declared, Detected, Default };

[[nodiscard]] std::string to_string(Source source);

struct Decision {
    std::string encoding;   // canonical, see canonicalize()
    Source source{Source::Default};
};

struct Decoded {
    Decision decision;
    std::string text;       // UTF-8
};

/// Finds a <meta charset=...> or content="...charset=..." declaration in the
/// first DECLARATION_SCAN_BYTES, read as ASCII with other bytes dropped.
/// Returns the value trimmed and lower-cased.
[[nodiscard]] std::optional<std::string> extractDeclaredCharset(const std::vector<uint8_t>& raw);

/// Declaration, then statistical guess, then utf-8. The winner is canonicalized.
[[nodiscard]] Decision decide(const std::vector<uint8_t>& raw);

/// Decides and decodes leniently. Binary input (isTextFile == false) is not
/// looked at and yields std::nullopt. Never throws for any byte content: an
/// encoding the codec layer does not know falls back to utf-8.
[[nodiscard]] std::optional<Decoded> resolve(const std::vector<uint8_t>& raw, bool isTextFile);

}
