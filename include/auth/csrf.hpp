#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace fb::auth {

// "<unix-seconds>.<hex HMAC-SHA256(secret, unix-seconds)>"
[[nodiscard]] std::string issueCsrfToken(const std::string& secret, std::time_t now);

/// True when the token has exactly two '.' separated parts, an integer
/// timestamp no older than ttl and a signature matching the secret.
/// Signatures are compared in constant time.
[[nodiscard]] bool verifyCsrfToken(const std::string& token, const std::string& secret,
                                   std::time_t now, std::chrono::seconds ttl);

[[nodiscard]] std::string hmacSha256Hex(const std::string& key, const std::string& data);

}
