#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct UCharsetDetector;

namespace fb::encoding {

struct Guess {
    std::string label;
    int confidence{};   // 0-100
};

// Statistical charset detection backed by ICU's ucsdet.
class Detector {
public:
    Detector();
    ~Detector();

    Detector(const Detector&) = delete;
    Detector& operator=(const Detector&) = delete;

    // Best guess over the whole buffer, std::nullopt when nothing matches.
    [[nodiscard]] std::optional<Guess> guess(const std::vector<uint8_t>& bytes) const;

private:
    UCharsetDetector* csd_;
};

}
