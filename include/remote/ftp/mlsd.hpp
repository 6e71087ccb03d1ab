#pragma once

#include "remote/Session.hpp"

#include <string>
#include <vector>

namespace fb::remote::ftp {

/// Parses an RFC 3659 MLSD listing, one "fact=value;fact=value; name" per line:
///   type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt
///   type=dir;sizd=4096;modify=20170117144634; folder
/// Fact names are matched case-insensitively. Lines without a name are skipped.
[[nodiscard]] std::vector<RemoteEntry> parseMlsd(const std::string& listing);

}
