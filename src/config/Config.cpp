#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <array>
#include <cstdlib>
#include <stdexcept>
#include <sodium.h>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace fb::config {

namespace {

constexpr size_t CSRF_SECRET_BYTES = 32;

std::string randomHexSecret() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium initialization failed");

    std::array<unsigned char, CSRF_SECRET_BYTES> raw{};
    randombytes_buf(raw.data(), raw.size());

    std::string hex(CSRF_SECRET_BYTES * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
    hex.resize(CSRF_SECRET_BYTES * 2);
    return hex;
}

void overrideFromEnv(const char* name, std::string& target) {
    if (const char* value = std::getenv(name)) target = value;
}

}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (const auto node = root["remote"]) YAML::convert<RemoteConfig>::decode(node, cfg.remote);
    if (const auto node = root["image_proxy"]) YAML::convert<ImageProxyConfig>::decode(node, cfg.image_proxy);
    if (const auto node = root["csrf"]) YAML::convert<CsrfConfig>::decode(node, cfg.csrf);
    if (const auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    applyEnvOverrides(cfg);

    if (cfg.csrf.secret.empty()) cfg.csrf.secret = randomHexSecret();

    return cfg;
}

void applyEnvOverrides(Config& cfg) {
    overrideFromEnv("FTP_HOST", cfg.remote.host);
    overrideFromEnv("FTP_USER", cfg.remote.user);
    overrideFromEnv("FTP_PASS", cfg.remote.password);
    overrideFromEnv("FTP_BASE_PATH", cfg.remote.base_path);
    overrideFromEnv("BANANA_API_KEY", cfg.image_proxy.api_key);
    overrideFromEnv("BANANA_API_URL", cfg.image_proxy.api_url);
    overrideFromEnv("CSRF_SECRET", cfg.csrf.secret);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"remote", c.remote},
        {"image_proxy", c.image_proxy},
        {"csrf", c.csrf},
        {"logging", c.logging}
    };
}

// Secrets are masked; this is only used for diagnostics.
void to_json(nlohmann::json& j, const RemoteConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"user", c.user},
        {"password", c.password.empty() ? "" : "********"},
        {"base_path", c.base_path},
        {"use_tls", c.use_tls},
        {"connect_timeout_seconds", c.connect_timeout_seconds},
        {"block_size", c.block_size}
    };
}

void to_json(nlohmann::json& j, const ImageProxyConfig& c) {
    j = {
        {"api_url", c.api_url},
        {"api_key", c.api_key.empty() ? "" : "********"},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const CsrfConfig& c) {
    j = {
        {"secret", c.secret.empty() ? "" : "********"},
        {"token_ttl_seconds", c.token_ttl_seconds}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", c.console_log_level},
        {"file_log_level", c.file_log_level},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"ftpbridge", c.ftpbridge},
        {"bridge", c.bridge},
        {"remote", c.remote},
        {"encoding", c.encoding},
        {"proxy", c.proxy},
        {"auth", c.auth}
    };
}

} // namespace fb::config
