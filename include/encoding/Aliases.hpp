#pragma once

#include <string>

namespace fb::encoding {

/// Maps regional spellings (Shift-JIS family, EUC-JP family, UTF-8) onto the
/// single converter name used throughout the bridge. The lookup key is the
/// input lower-cased with '-' folded to '_'. Names that are not in the table
/// are returned unchanged.
[[nodiscard]] std::string canonicalize(const std::string& name);

}
