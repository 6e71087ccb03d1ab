#pragma once

#include <stdexcept>
#include <string>

namespace fb {

// User supplied a path that escapes the configured root.
class InvalidPath : public std::runtime_error {
public:
    explicit InvalidPath(const std::string& path)
        : std::runtime_error("Invalid path: " + path), path_(path) {}

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Remote session, protocol or streaming fault. what() always carries the underlying description.
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& msg) : std::runtime_error(msg) {}
};

// Text cannot be represented in the requested output encoding.
class EncodeError : public std::runtime_error {
public:
    EncodeError(const std::string& encoding, const std::string& detail)
        : std::runtime_error("Cannot encode content as " + encoding +
                             ": it contains characters that are not representable in this encoding. "
                             "Saving as UTF-8 is recommended. Detail: " + detail),
          encoding_(encoding) {}

    [[nodiscard]] const std::string& encoding() const { return encoding_; }

private:
    std::string encoding_;
};

}
