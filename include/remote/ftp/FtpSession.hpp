#pragma once

#include "remote/Session.hpp"
#include "util/curlWrappers.hpp"

#include <string>

namespace fb::config { struct RemoteConfig; }

namespace fb::remote::ftp {

struct Options {
    bool use_tls = false;
    unsigned int connect_timeout_seconds = 30;
};

/// FTP session on one libcurl easy handle. The control connection opened by
/// authenticate() is kept in the handle's connection cache and reused by every
/// later transfer until close() cleans the handle up (curl sends QUIT).
class FtpSession final : public Session {
public:
    FtpSession(const std::string& host, uint16_t port, Options opts);
    ~FtpSession() override;

    void authenticate(const std::string& user, const std::string& password) override;

    [[nodiscard]] std::vector<RemoteEntry> listChildren(const std::string& path) override;

    void download(const std::string& path, size_t blockSize, const BlockSink& sink) override;

    void upload(const std::string& path, const std::vector<uint8_t>& bytes) override;

    void close() override;

    // Absolute remote paths are addressed with a leading %2F, see RFC 1738 3.2.2.
    [[nodiscard]] std::string urlFor(const std::string& path, bool isDir) const;

private:
    util::CurlEasy curl_;
    std::string baseUrl_;
    Options opts_;
    std::string user_, password_;
    char errBuf_[CURL_ERROR_SIZE]{};

    void applyBaseOptions();

    void perform(const std::string& op, const std::string& path);
};

class FtpConnector final : public Connector {
public:
    explicit FtpConnector(const config::RemoteConfig& cfg);

    [[nodiscard]] std::unique_ptr<Session> connect(const std::string& host, uint16_t port) override;

private:
    Options opts_;
};

}
