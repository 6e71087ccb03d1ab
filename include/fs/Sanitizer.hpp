#pragma once

#include <string>

namespace fb::fs {

// Root-prefixed, normalized remote path. Never contains a ".." segment.
using RemotePath = std::string;

/// Normalizes a caller supplied path lexically and anchors it under root.
/// Backslashes are treated as separators and leading slashes are ignored, so
/// "/docs/index.html" and "docs/index.html" resolve to the same remote path.
/// Throws fb::InvalidPath if the normalized path climbs out of root or starts with "..".
[[nodiscard]] RemotePath sanitize(const std::string& userPath, const std::string& root);

}
