#pragma once

#include "config/Config.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fb::proxy {

class ProxyError : public std::runtime_error {
public:
    enum class Kind { NotConfigured, InvalidRequest, Upstream };

    ProxyError(const Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] Kind kind() const { return kind_; }

private:
    Kind kind_;
};

struct ImageRequest {
    std::string mode;       // t2i | i2i | m2i
    std::string prompt;
    int width = 512, height = 512;
    std::optional<std::string> init_image;
    std::optional<double> strength;
    std::optional<std::vector<std::string>> images;
    std::optional<std::string> style_image;
};

// Throws ProxyError(InvalidRequest) when mode or prompt is missing or a field has the wrong type.
void from_json(const nlohmann::json& j, ImageRequest& r);

struct UpstreamCall {
    std::string endpoint;
    nlohmann::json payload;
};

constexpr double DEFAULT_I2I_STRENGTH = 0.3;

/// Maps a request onto the upstream endpoint and body for its mode.
/// Throws ProxyError(InvalidRequest) for an unknown mode.
[[nodiscard]] UpstreamCall buildUpstreamCall(const ImageRequest& req, const config::ImageProxyConfig& cfg);

class ImageProxy {
public:
    explicit ImageProxy(const config::ImageProxyConfig& cfg);

    // Returns the upstream JSON body as is.
    [[nodiscard]] nlohmann::json generate(const ImageRequest& req) const;

private:
    const config::ImageProxyConfig cfg_;
};

}
