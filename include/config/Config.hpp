#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace fb::config {

constexpr static size_t DEFAULT_BLOCK_SIZE = 8192;
constexpr static unsigned int DEFAULT_CSRF_TTL_SECONDS = 3600;

struct RemoteConfig {
    std::string host = "localhost";
    uint16_t port = 21;
    std::string user = "anonymous";
    std::string password;
    std::string base_path = "/";
    bool use_tls = false;
    unsigned int connect_timeout_seconds = 30;
    size_t block_size = DEFAULT_BLOCK_SIZE;
};

struct ImageProxyConfig {
    std::string api_url = "https://api.nanobanana.com/v1";
    std::string api_key;
    unsigned int timeout_seconds = 120;
};

struct CsrfConfig {
    std::string secret;
    unsigned int token_ttl_seconds = DEFAULT_CSRF_TTL_SECONDS;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum ftpbridge = spdlog::level::info;  // Startup, shutdown, CLI dispatch
    spdlog::level::level_enum bridge    = spdlog::level::info;  // One line per list/read/write/upload
    spdlog::level::level_enum remote    = spdlog::level::warn;  // FTP connect/login/transfer failures
    spdlog::level::level_enum encoding  = spdlog::level::warn;  // Lookup fallbacks
    spdlog::level::level_enum proxy     = spdlog::level::warn;  // Upstream API errors
    spdlog::level::level_enum auth      = spdlog::level::warn;  // Rejected CSRF tokens
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/ftpbridge";
    LogLevelsConfig levels;
};

struct Config {
    RemoteConfig remote;
    ImageProxyConfig image_proxy;
    CsrfConfig csrf;
    LoggingConfig logging;
};

// Reads the YAML file, applies environment overrides and fills in a random CSRF secret when none is set.
Config loadConfig(const std::filesystem::path& path);

// Environment variables win over the file: FTP_HOST, FTP_USER, FTP_PASS, FTP_BASE_PATH,
// BANANA_API_KEY, BANANA_API_URL, CSRF_SECRET.
void applyEnvOverrides(Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const RemoteConfig& c);
void to_json(nlohmann::json& j, const ImageProxyConfig& c);
void to_json(nlohmann::json& j, const CsrfConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace fb::config
