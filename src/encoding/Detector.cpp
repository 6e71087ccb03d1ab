#include "encoding/Detector.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <unicode/ucsdet.h>

using namespace fb::encoding;
using namespace fb::log;

Detector::Detector() {
    UErrorCode status = U_ZERO_ERROR;
    csd_ = ucsdet_open(&status);
    if (U_FAILURE(status) || !csd_) {
        if (csd_) ucsdet_close(csd_);
        throw std::runtime_error(std::string("Failed to open ICU charset detector: ") + u_errorName(status));
    }
}

Detector::~Detector() {
    if (csd_) ucsdet_close(csd_);
}

std::optional<Guess> Detector::guess(const std::vector<uint8_t>& bytes) const {
    if (bytes.empty()) return std::nullopt;

    const auto length = static_cast<int32_t>(
        std::min<size_t>(bytes.size(), std::numeric_limits<int32_t>::max()));

    UErrorCode status = U_ZERO_ERROR;
    ucsdet_setText(csd_, reinterpret_cast<const char*>(bytes.data()), length, &status);
    if (U_FAILURE(status)) {
        Registry::encoding()->warn("[Detector] ucsdet_setText failed: {}", u_errorName(status));
        return std::nullopt;
    }

    const UCharsetMatch* match = ucsdet_detect(csd_, &status);
    if (U_FAILURE(status) || !match) return std::nullopt;

    const char* name = ucsdet_getName(match, &status);
    if (U_FAILURE(status) || !name) return std::nullopt;

    const int32_t confidence = ucsdet_getConfidence(match, &status);
    if (U_FAILURE(status)) return std::nullopt;

    return Guess{name, confidence};
}
