#include "proxy/ImageProxy.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"

#include <fmt/core.h>

using namespace fb::log;
using namespace fb::util;

namespace fb::proxy {

void from_json(const nlohmann::json& j, ImageRequest& r) {
    try {
        j.at("mode").get_to(r.mode);
        j.at("prompt").get_to(r.prompt);
        r.width = j.value("width", 512);
        r.height = j.value("height", 512);

        const auto present = [&j](const char* key) { return j.contains(key) && !j.at(key).is_null(); };
        if (present("init_image")) r.init_image = j.at("init_image").get<std::string>();
        if (present("strength")) r.strength = j.at("strength").get<double>();
        if (present("images")) r.images = j.at("images").get<std::vector<std::string>>();
        if (present("style_image")) r.style_image = j.at("style_image").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw ProxyError(ProxyError::Kind::InvalidRequest, fmt::format("Invalid image request: {}", e.what()));
    }
}

UpstreamCall buildUpstreamCall(const ImageRequest& req, const config::ImageProxyConfig& cfg) {
    std::string base = cfg.api_url;
    while (!base.empty() && base.back() == '/') base.pop_back();

    const auto orNull = [](const std::optional<std::string>& v) -> nlohmann::json {
        return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
    };

    if (req.mode == "t2i")
        return {base + "/text-to-image", {
            {"prompt", req.prompt},
            {"width", req.width},
            {"height", req.height}
        }};

    if (req.mode == "i2i") {
        // a zero strength is treated as unset
        const double strength = req.strength && *req.strength != 0.0 ? *req.strength : DEFAULT_I2I_STRENGTH;
        return {base + "/image-to-image", {
            {"prompt", req.prompt},
            {"init_image", orNull(req.init_image)},
            {"strength", strength},
            {"width", req.width},
            {"height", req.height}
        }};
    }

    if (req.mode == "m2i")
        return {base + "/multi-image", {
            {"prompt", req.prompt},
            {"images", req.images.value_or(std::vector<std::string>{})},
            {"style_image", orNull(req.style_image)},
            {"width", req.width},
            {"height", req.height}
        }};

    throw ProxyError(ProxyError::Kind::InvalidRequest, "Unknown mode: " + req.mode);
}

ImageProxy::ImageProxy(const config::ImageProxyConfig& cfg) : cfg_(cfg) {}

nlohmann::json ImageProxy::generate(const ImageRequest& req) const {
    if (cfg_.api_key.empty())
        throw ProxyError(ProxyError::Kind::NotConfigured, "Image API key not configured");

    const auto call = buildUpstreamCall(req, cfg_);
    const auto body = call.payload.dump();

    SList headers;
    headers.add("Content-Type: application/json");
    headers.add("Authorization: Bearer " + cfg_.api_key);

    Registry::proxy()->debug("[ImageProxy] POST {} ({})", call.endpoint, req.mode);

    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, call.endpoint.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    });

    if (res.curl != CURLE_OK) {
        Registry::proxy()->error("[ImageProxy] {} failed: {}", call.endpoint, res.error);
        throw ProxyError(ProxyError::Kind::Upstream, "AI API error: " + res.error);
    }

    if (res.http != 200) {
        Registry::proxy()->error("[ImageProxy] {} returned HTTP {}: {}", call.endpoint, res.http, res.body);
        throw ProxyError(ProxyError::Kind::Upstream, "AI API error: " + res.body);
    }

    try {
        return nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProxyError(ProxyError::Kind::Upstream, fmt::format("AI API returned invalid JSON: {}", e.what()));
    }
}

}
