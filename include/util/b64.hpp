#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fb::util {

// Standard alphabet, padded.
std::string b64_encode(const std::vector<uint8_t>& data);

}
