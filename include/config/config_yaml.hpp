#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fb::config;

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["user"] = rhs.user;
        node["password"] = rhs.password;
        node["base_path"] = rhs.base_path;
        node["use_tls"] = rhs.use_tls;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["block_size"] = rhs.block_size;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(21);
        rhs.user = node["user"].as<std::string>("anonymous");
        rhs.password = node["password"].as<std::string>("");
        rhs.base_path = node["base_path"].as<std::string>("/");
        rhs.use_tls = node["use_tls"].as<bool>(false);
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(30);
        rhs.block_size = node["block_size"].as<size_t>(DEFAULT_BLOCK_SIZE);
        if (rhs.block_size == 0) rhs.block_size = DEFAULT_BLOCK_SIZE;
        return true;
    }
};

template<>
struct convert<ImageProxyConfig> {
    static Node encode(const ImageProxyConfig& rhs) {
        Node node;
        node["api_url"] = rhs.api_url;
        node["api_key"] = rhs.api_key;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, ImageProxyConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.api_url = node["api_url"].as<std::string>("https://api.nanobanana.com/v1");
        rhs.api_key = node["api_key"].as<std::string>("");
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(120);
        return true;
    }
};

template<>
struct convert<CsrfConfig> {
    static Node encode(const CsrfConfig& rhs) {
        Node node;
        node["secret"] = rhs.secret;
        node["token_ttl_seconds"] = rhs.token_ttl_seconds;
        return node;
    }

    static bool decode(const Node& node, CsrfConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.secret = node["secret"].as<std::string>("");
        rhs.token_ttl_seconds = node["token_ttl_seconds"].as<unsigned int>(DEFAULT_CSRF_TTL_SECONDS);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["ftpbridge"] = to_std_string(spdlog::level::to_string_view(rhs.ftpbridge));
        node["bridge"]    = to_std_string(spdlog::level::to_string_view(rhs.bridge));
        node["remote"]    = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["encoding"]  = to_std_string(spdlog::level::to_string_view(rhs.encoding));
        node["proxy"]     = to_std_string(spdlog::level::to_string_view(rhs.proxy));
        node["auth"]      = to_std_string(spdlog::level::to_string_view(rhs.auth));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ftpbridge = spdlog::level::from_str(node["ftpbridge"].as<std::string>("info"));
        rhs.bridge = spdlog::level::from_str(node["bridge"].as<std::string>("info"));
        rhs.remote = spdlog::level::from_str(node["remote"].as<std::string>("warn"));
        rhs.encoding = spdlog::level::from_str(node["encoding"].as<std::string>("warn"));
        rhs.proxy = spdlog::level::from_str(node["proxy"].as<std::string>("warn"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/ftpbridge");
        if (const auto levels = node["levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
