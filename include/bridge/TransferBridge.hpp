#pragma once

#include "bridge/model/Entry.hpp"
#include "config/Config.hpp"
#include "remote/Session.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fb::bridge {

constexpr const auto* VERSION = "1.2.0";

struct Health {
    std::string status = "ok";
    std::string version = VERSION;
};

void to_json(nlohmann::json& j, const Health& h);

[[nodiscard]] Health health();

/// Moves files between callers and the remote store rooted at base_path.
/// Every operation sanitizes its path before anything else, then opens exactly
/// one session through the connector and closes it on every exit path.
///
/// Throws InvalidPath, EncodeError (write only) and TransferError; any other
/// session fault is reported as TransferError.
class TransferBridge {
public:
    TransferBridge(const config::RemoteConfig& cfg, std::shared_ptr<remote::Connector> connector);

    [[nodiscard]] std::vector<model::DirectoryEntry> list(const std::string& path) const;

    [[nodiscard]] model::ReadResult read(const std::string& path) const;

    // encoding defaults to utf-8. The content is encoded before a session is opened.
    model::WriteResult write(const std::string& path, const std::string& content,
                             const std::optional<std::string>& encodingName = std::nullopt) const;

    model::UploadResult uploadBinary(const std::string& directory, const std::string& filename,
                                     const std::vector<uint8_t>& bytes) const;

private:
    const config::RemoteConfig cfg_;
    std::shared_ptr<remote::Connector> connector_;

    [[nodiscard]] std::unique_ptr<remote::Session> openSession() const;
};

}
