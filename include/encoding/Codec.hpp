#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fb::encoding {

// Replace substitutes U+FFFD (decode) or the converter's substitution bytes (encode).
enum class ErrorPolicy { Strict, Replace };

// The converter name is not known to the codec layer.
class CodecLookupError : public std::runtime_error {
public:
    explicit CodecLookupError(const std::string& name)
        : std::runtime_error("Unknown encoding: " + name) {}
};

// Data could not be converted under ErrorPolicy::Strict.
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& msg) : std::runtime_error(msg) {}
};

// ICU takes int32_t lengths. Throws CodecError for buffers larger than INT32_MAX.
[[nodiscard]] int32_t icuLength(size_t size);

/// Converts bytes in the named encoding to UTF-8 text.
/// Throws CodecLookupError for unknown names; CodecError only under ErrorPolicy::Strict.
[[nodiscard]] std::string decode(const std::vector<uint8_t>& bytes, const std::string& name, ErrorPolicy policy);

/// Converts UTF-8 text to bytes in the named encoding.
/// Throws CodecLookupError for unknown names; CodecError when a character has no mapping
/// (or the input is not valid UTF-8) under ErrorPolicy::Strict.
[[nodiscard]] std::vector<uint8_t> encode(const std::string& utf8, const std::string& name, ErrorPolicy policy);

}
