#include "auth/csrf.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <sstream>

using namespace fb::log;

namespace fb::auth {

std::string hmacSha256Hex(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);

    std::ostringstream oss;
    for (const unsigned char i : digest) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(i);
    return oss.str();
}

std::string issueCsrfToken(const std::string& secret, const std::time_t now) {
    const auto ts = std::to_string(static_cast<long long>(now));
    return ts + "." + hmacSha256Hex(secret, ts);
}

bool verifyCsrfToken(const std::string& token, const std::string& secret,
                     const std::time_t now, const std::chrono::seconds ttl) {
    if (std::ranges::count(token, '.') != 1) {
        Registry::auth()->warn("[CSRF] Rejected malformed token");
        return false;
    }

    const auto dot = token.find('.');
    const std::string ts = token.substr(0, dot);
    const std::string sig = token.substr(dot + 1);

    long long issued = 0;
    const auto [end, ec] = std::from_chars(ts.data(), ts.data() + ts.size(), issued);
    if (ts.empty() || ec != std::errc() || end != ts.data() + ts.size()) {
        Registry::auth()->warn("[CSRF] Rejected token with non-numeric timestamp");
        return false;
    }

    if (static_cast<long long>(now) - issued > ttl.count()) {
        Registry::auth()->warn("[CSRF] Rejected expired token issued at {}", issued);
        return false;
    }

    const auto expected = hmacSha256Hex(secret, ts);
    if (sig.size() != expected.size() || CRYPTO_memcmp(sig.data(), expected.data(), expected.size()) != 0) {
        Registry::auth()->warn("[CSRF] Rejected token with bad signature");
        return false;
    }

    return true;
}

}
