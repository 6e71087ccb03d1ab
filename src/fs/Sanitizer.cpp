#include "fs/Sanitizer.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <filesystem>

namespace fb::fs {

RemotePath sanitize(const std::string& userPath, const std::string& root) {
    std::string rel = userPath;
    std::ranges::replace(rel, '\\', '/');

    const auto firstNonSlash = rel.find_first_not_of('/');
    rel = firstNonSlash == std::string::npos ? std::string{} : rel.substr(firstNonSlash);

    const auto normalized = std::filesystem::path(rel).lexically_normal();
    for (const auto& segment : normalized)
        if (segment == "..") throw InvalidPath(userPath);

    std::string out = normalized.generic_string();
    if (out.starts_with("..")) throw InvalidPath(userPath);
    if (out == ".") out.clear();

    std::string base = root;
    while (!base.empty() && base.back() == '/') base.pop_back();

    return base + "/" + out;
}

}
