#include "encoding/Aliases.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace fb::encoding {

std::string canonicalize(const std::string& name) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"shift_jis", "cp932"},
        {"shiftjis", "cp932"},
        {"sjis", "cp932"},
        {"x_sjis", "cp932"},
        {"ms_kanji", "cp932"},
        {"windows_31j", "cp932"},
        {"ms932", "cp932"},
        {"euc_jp", "euc_jp"},
        {"eucjp", "euc_jp"},
        {"x_euc_jp", "euc_jp"},
        {"utf_8", "utf-8"},
        {"utf8", "utf-8"},
    };

    std::string key = name;
    std::ranges::transform(key, key.begin(), [](const unsigned char c) { return std::tolower(c); });
    std::ranges::replace(key, '-', '_');

    const auto it = aliases.find(key);
    return it != aliases.end() ? it->second : name;
}

}
