#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace fb::remote {

// One child as reported by the server listing.
struct RemoteEntry {
    std::string name;
    std::string type;       // "file", "dir", "cdir", "pdir", ... lower-cased
    uintmax_t size{0};
    std::string modify;     // server timestamp, YYYYMMDDHHMMSS[.fff]
};

// Receives downloaded bytes block by block, in order.
using BlockSink = std::function<void(const uint8_t* data, size_t len)>;

/// A single authenticated connection to the remote store. Implementations
/// throw std::runtime_error (or a subclass) on any connection, protocol or
/// streaming fault. A session is used by exactly one bridge operation.
class Session {
public:
    virtual ~Session() = default;

    virtual void authenticate(const std::string& user, const std::string& password) = 0;

    // Immediate children of a directory.
    [[nodiscard]] virtual std::vector<RemoteEntry> listChildren(const std::string& path) = 0;

    virtual void download(const std::string& path, size_t blockSize, const BlockSink& sink) = 0;

    virtual void upload(const std::string& path, const std::vector<uint8_t>& bytes) = 0;

    // Idempotent.
    virtual void close() = 0;
};

class Connector {
public:
    virtual ~Connector() = default;

    [[nodiscard]] virtual std::unique_ptr<Session> connect(const std::string& host, uint16_t port) = 0;
};

}
