#include "bridge/TransferBridge.hpp"
#include "encoding/Aliases.hpp"
#include "encoding/Codec.hpp"
#include "encoding/Resolver.hpp"
#include "fs/Sanitizer.hpp"
#include "fs/classify.hpp"
#include "log/Registry.hpp"
#include "util/b64.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace fb::bridge::model;
using namespace fb::remote;
using namespace fb::log;

namespace {

constexpr const auto* OCTET_STREAM = "application/octet-stream";
constexpr const auto* BINARY_ENCODING = "binary";

// Closes the session on scope exit. A failing close is logged, never thrown,
// so it cannot replace the outcome of the operation.
class ScopedSession {
public:
    explicit ScopedSession(std::unique_ptr<Session> s) : session_(std::move(s)) {}

    ~ScopedSession() {
        if (!session_) return;
        try {
            session_->close();
        } catch (const std::exception& e) {
            if (Registry::isInitialized())
                Registry::remote()->warn("[TransferBridge] Failed to close session: {}", e.what());
        } catch (...) {
            if (Registry::isInitialized())
                Registry::remote()->warn("[TransferBridge] Failed to close session: unknown error");
        }
    }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    Session* operator->() const { return session_.get(); }

private:
    std::unique_ptr<Session> session_;
};

std::string stripTrailingSlashes(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

template <class Fn>
auto withTransferErrors(const std::string& op, const std::string& path, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const fb::TransferError& e) {
        Registry::bridge()->error("[TransferBridge] {} {} failed: {}", op, path, e.what());
        throw;
    } catch (const std::exception& e) {
        Registry::bridge()->error("[TransferBridge] {} {} failed: {}", op, path, e.what());
        throw fb::TransferError(e.what());
    }
}

}

namespace fb::bridge {

void to_json(nlohmann::json& j, const Health& h) {
    j = {{"status", h.status}, {"version", h.version}};
}

Health health() { return {}; }

TransferBridge::TransferBridge(const config::RemoteConfig& cfg, std::shared_ptr<Connector> connector)
    : cfg_(cfg), connector_(std::move(connector)) {
    if (!connector_) throw std::invalid_argument("[TransferBridge] Connector must not be null");
}

std::unique_ptr<Session> TransferBridge::openSession() const {
    auto session = connector_->connect(cfg_.host, cfg_.port);
    if (!session) throw TransferError(fmt::format("Failed to connect to {}:{}", cfg_.host, cfg_.port));
    return session;
}

std::vector<DirectoryEntry> TransferBridge::list(const std::string& path) const {
    const auto remotePath = fs::sanitize(path, cfg_.base_path);

    return withTransferErrors("list", remotePath, [&] {
        const ScopedSession session(openSession());
        session->authenticate(cfg_.user, cfg_.password);

        const auto prefix = stripTrailingSlashes(path);
        std::vector<DirectoryEntry> out;

        for (const auto& child : session->listChildren(remotePath)) {
            if (child.name.empty() || child.name == "." || child.name == "..") continue;
            if (child.type == "cdir" || child.type == "pdir") continue;

            DirectoryEntry e;
            e.name = child.name;
            e.path = prefix + "/" + child.name;
            e.kind = child.type == "dir" ? EntryKind::Directory : EntryKind::File;
            e.size = child.size;
            e.modified = child.modify;
            e.mime_type = fs::guessMimeType(child.name).value_or("");
            out.push_back(std::move(e));
        }

        Registry::bridge()->info("[TransferBridge] Listed {} ({} entries)", remotePath, out.size());
        return out;
    });
}

ReadResult TransferBridge::read(const std::string& path) const {
    const auto remotePath = fs::sanitize(path, cfg_.base_path);

    std::vector<uint8_t> raw;
    withTransferErrors("read", remotePath, [&] {
        const ScopedSession session(openSession());
        session->authenticate(cfg_.user, cfg_.password);
        session->download(remotePath, cfg_.block_size, [&raw](const uint8_t* data, const size_t len) {
            raw.insert(raw.end(), data, data + len);
        });
    });

    ReadResult result;
    result.mime_type = fs::guessMimeType(path).value_or(OCTET_STREAM);

    if (const auto decoded = encoding::resolve(raw, fs::isTextFile(path))) {
        result.content = decoded->text;
        result.detected_encoding = decoded->decision.encoding;
        Registry::bridge()->info("[TransferBridge] Read {} ({} bytes, {} {})", remotePath, raw.size(),
                                 decoded->decision.encoding, encoding::to_string(decoded->decision.source));
    } else {
        result.content = util::b64_encode(raw);
        result.detected_encoding = BINARY_ENCODING;
        Registry::bridge()->info("[TransferBridge] Read {} ({} bytes, binary)", remotePath, raw.size());
    }

    return result;
}

WriteResult TransferBridge::write(const std::string& path, const std::string& content,
                                  const std::optional<std::string>& encodingName) const {
    const auto remotePath = fs::sanitize(path, cfg_.base_path);
    const auto target = encoding::canonicalize(encodingName.value_or("utf-8"));

    std::vector<uint8_t> bytes;
    try {
        bytes = encoding::encode(content, target, encoding::ErrorPolicy::Strict);
    } catch (const encoding::CodecLookupError& e) {
        throw EncodeError(target, e.what());
    } catch (const encoding::CodecError& e) {
        throw EncodeError(target, e.what());
    }

    withTransferErrors("write", remotePath, [&] {
        const ScopedSession session(openSession());
        session->authenticate(cfg_.user, cfg_.password);
        session->upload(remotePath, bytes);
    });

    Registry::bridge()->info("[TransferBridge] Wrote {} ({} bytes as {})", remotePath, bytes.size(), target);
    return {};
}

UploadResult TransferBridge::uploadBinary(const std::string& directory, const std::string& filename,
                                          const std::vector<uint8_t>& bytes) const {
    const auto url = directory + "/" + filename;
    const auto remotePath = fs::sanitize(url, cfg_.base_path);

    withTransferErrors("upload", remotePath, [&] {
        const ScopedSession session(openSession());
        session->authenticate(cfg_.user, cfg_.password);
        session->upload(remotePath, bytes);
    });

    Registry::bridge()->info("[TransferBridge] Uploaded {} ({} bytes)", remotePath, bytes.size());
    return {url};
}

}
