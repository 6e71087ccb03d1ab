#include <gtest/gtest.h>
#include "proxy/ImageProxy.hpp"

using namespace fb::proxy;
using namespace fb::config;
using nlohmann::json;

class ImageProxyTest : public ::testing::Test {
protected:
    ImageProxyConfig cfg;

    void SetUp() override {
        cfg.api_url = "https://images.example.com/v1/";
        cfg.api_key = "test-key";
    }

    static ImageRequest request(const json& j) { return j.get<ImageRequest>(); }
};

TEST_F(ImageProxyTest, TextToImage) {
    const auto call = buildUpstreamCall(request({{"mode", "t2i"}, {"prompt", "a red bicycle"}}), cfg);
    EXPECT_EQ(call.endpoint, "https://images.example.com/v1/text-to-image");
    EXPECT_EQ(call.payload, json({{"prompt", "a red bicycle"}, {"width", 512}, {"height", 512}}));
}

TEST_F(ImageProxyTest, ImageToImageDefaultsStrength) {
    const auto call = buildUpstreamCall(request({
        {"mode", "i2i"}, {"prompt", "blue sky"}, {"init_image", "data:image/png;base64,AAAA"},
        {"width", 1024}, {"height", 768}}), cfg);

    EXPECT_EQ(call.endpoint, "https://images.example.com/v1/image-to-image");
    EXPECT_EQ(call.payload["init_image"], "data:image/png;base64,AAAA");
    EXPECT_DOUBLE_EQ(call.payload["strength"].get<double>(), DEFAULT_I2I_STRENGTH);
    EXPECT_EQ(call.payload["width"], 1024);
    EXPECT_EQ(call.payload["height"], 768);
}

TEST_F(ImageProxyTest, ImageToImageKeepsExplicitStrength) {
    const auto call = buildUpstreamCall(request({{"mode", "i2i"}, {"prompt", "p"}, {"strength", 0.75}}), cfg);
    EXPECT_DOUBLE_EQ(call.payload["strength"].get<double>(), 0.75);
    EXPECT_TRUE(call.payload["init_image"].is_null());
}

TEST_F(ImageProxyTest, MultiImage) {
    const auto withImages = buildUpstreamCall(request({
        {"mode", "m2i"}, {"prompt", "merge"}, {"images", {"a", "b"}}, {"style_image", "s"}}), cfg);
    EXPECT_EQ(withImages.endpoint, "https://images.example.com/v1/multi-image");
    EXPECT_EQ(withImages.payload["images"], json({"a", "b"}));
    EXPECT_EQ(withImages.payload["style_image"], "s");

    const auto bare = buildUpstreamCall(request({{"mode", "m2i"}, {"prompt", "merge"}}), cfg);
    EXPECT_EQ(bare.payload["images"], json::array());
    EXPECT_TRUE(bare.payload["style_image"].is_null());
}

TEST_F(ImageProxyTest, UnknownModeIsInvalidRequest) {
    try {
        (void)buildUpstreamCall(request({{"mode", "video"}, {"prompt", "p"}}), cfg);
        FAIL() << "expected ProxyError";
    } catch (const ProxyError& e) {
        EXPECT_EQ(e.kind(), ProxyError::Kind::InvalidRequest);
        EXPECT_STREQ(e.what(), "Unknown mode: video");
    }
}

TEST_F(ImageProxyTest, MalformedRequestIsInvalidRequest) {
    try {
        (void)request({{"prompt", "no mode"}});
        FAIL() << "expected ProxyError";
    } catch (const ProxyError& e) {
        EXPECT_EQ(e.kind(), ProxyError::Kind::InvalidRequest);
    }
    EXPECT_THROW((void)request({{"mode", "t2i"}, {"prompt", "p"}, {"width", "wide"}}), ProxyError);
}

TEST_F(ImageProxyTest, MissingApiKeyIsNotConfigured) {
    cfg.api_key.clear();
    const ImageProxy proxy(cfg);
    try {
        (void)proxy.generate(request({{"mode", "t2i"}, {"prompt", "p"}}));
        FAIL() << "expected ProxyError";
    } catch (const ProxyError& e) {
        EXPECT_EQ(e.kind(), ProxyError::Kind::NotConfigured);
    }
}
