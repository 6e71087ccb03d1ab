#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace fb::config;

class ConfigTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        for (const auto* var : {"FTP_HOST", "FTP_USER", "FTP_PASS", "FTP_BASE_PATH",
                                "BANANA_API_KEY", "BANANA_API_URL", "CSRF_SECRET"})
            ::unsetenv(var);
        file = fs::temp_directory_path() / ("ftpbridge-config-" + std::to_string(::getpid()) + ".yaml");
    }

    void TearDown() override {
        ::unsetenv("FTP_HOST");
        ::unsetenv("CSRF_SECRET");
        fs::remove(file);
    }

    void write(const std::string& yaml) const {
        std::ofstream(file) << yaml;
    }
};

TEST_F(ConfigTest, ReadsAllSections) {
    write(R"(
remote:
  host: ftp.example.com
  port: 2121
  user: deploy
  password: hunter2
  base_path: /public_html
  use_tls: true
  block_size: 4096
image_proxy:
  api_key: key-123
  timeout_seconds: 30
csrf:
  secret: s3cret
  token_ttl_seconds: 600
logging:
  log_dir: /tmp/ftpbridge-logs
  levels:
    console_log_level: debug
    subsystem_levels:
      bridge: trace
)");

    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.remote.host, "ftp.example.com");
    EXPECT_EQ(cfg.remote.port, 2121);
    EXPECT_EQ(cfg.remote.user, "deploy");
    EXPECT_EQ(cfg.remote.password, "hunter2");
    EXPECT_EQ(cfg.remote.base_path, "/public_html");
    EXPECT_TRUE(cfg.remote.use_tls);
    EXPECT_EQ(cfg.remote.block_size, 4096u);
    EXPECT_EQ(cfg.remote.connect_timeout_seconds, 30u);
    EXPECT_EQ(cfg.image_proxy.api_key, "key-123");
    EXPECT_EQ(cfg.image_proxy.api_url, "https://api.nanobanana.com/v1");
    EXPECT_EQ(cfg.image_proxy.timeout_seconds, 30u);
    EXPECT_EQ(cfg.csrf.secret, "s3cret");
    EXPECT_EQ(cfg.csrf.token_ttl_seconds, 600u);
    EXPECT_EQ(cfg.logging.log_dir.string(), "/tmp/ftpbridge-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.bridge, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.remote, spdlog::level::warn);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    write("remote:\n  host: h\n");
    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.remote.port, 21);
    EXPECT_EQ(cfg.remote.base_path, "/");
    EXPECT_EQ(cfg.remote.block_size, DEFAULT_BLOCK_SIZE);
    EXPECT_EQ(cfg.image_proxy.timeout_seconds, 120u);
    EXPECT_EQ(cfg.csrf.token_ttl_seconds, DEFAULT_CSRF_TTL_SECONDS);
}

TEST_F(ConfigTest, GeneratesCsrfSecretWhenEmpty) {
    write("csrf:\n  secret: \"\"\n");
    const auto a = loadConfig(file);
    const auto b = loadConfig(file);
    EXPECT_EQ(a.csrf.secret.size(), 64u);
    EXPECT_NE(a.csrf.secret, b.csrf.secret);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write("remote:\n  host: from-file\ncsrf:\n  secret: file-secret\n");
    ::setenv("FTP_HOST", "from-env", 1);
    ::setenv("CSRF_SECRET", "env-secret", 1);

    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.remote.host, "from-env");
    EXPECT_EQ(cfg.csrf.secret, "env-secret");
}

TEST_F(ConfigTest, JsonMasksSecrets) {
    Config cfg;
    cfg.remote.password = "hunter2";
    cfg.image_proxy.api_key = "key-123";
    cfg.csrf.secret = "s3cret";

    const nlohmann::json j = cfg;
    const auto dumped = j.dump();
    EXPECT_EQ(dumped.find("hunter2"), std::string::npos);
    EXPECT_EQ(dumped.find("key-123"), std::string::npos);
    EXPECT_EQ(dumped.find("s3cret"), std::string::npos);
    EXPECT_EQ(j["remote"]["host"], "localhost");
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW((void)loadConfig(file.string() + ".missing"), std::exception);
}
