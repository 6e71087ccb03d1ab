#include "encoding/Codec.hpp"

#include <fmt/core.h>
#include <limits>
#include <unicode/ucnv.h>
#include <unicode/ucnv_cb.h>
#include <unicode/unistr.h>
#include <unicode/ustring.h>

namespace fb::encoding {

namespace {

// Owns one UConverter for the duration of a single conversion.
class Converter {
public:
    explicit Converter(const std::string& name) {
        if (name.empty()) throw CodecLookupError(name);

        UErrorCode status = U_ZERO_ERROR;
        cnv_ = ucnv_open(name.c_str(), &status);
        if (U_FAILURE(status) || !cnv_) {
            if (cnv_) ucnv_close(cnv_);
            throw CodecLookupError(name);
        }
    }

    ~Converter() { ucnv_close(cnv_); }

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    operator UConverter*() const { return cnv_; }

private:
    UConverter* cnv_ = nullptr;
};

// ICU's stock substitute callback emits U+001A for single invalid bytes on some
// DBCS converters; the bridge always wants a visible U+FFFD.
void writeReplacementChar(const void*, UConverterToUnicodeArgs* args, const char*, int32_t,
                          const UConverterCallbackReason reason, UErrorCode* err) {
    if (reason > UCNV_IRREGULAR) return;
    static constexpr UChar kReplacement = 0xFFFD;
    *err = U_ZERO_ERROR;
    ucnv_cbToUWriteUChars(args, &kReplacement, 1, 0, err);
}

std::vector<UChar> utf8ToUtf16(const std::string& utf8, const ErrorPolicy policy) {
    UErrorCode status = U_ZERO_ERROR;
    int32_t length = 0;
    const auto srcLength = icuLength(utf8.size());

    const auto convert = [&](UChar* dest, const int32_t capacity) {
        if (policy == ErrorPolicy::Strict)
            u_strFromUTF8(dest, capacity, &length, utf8.data(), srcLength, &status);
        else
            u_strFromUTF8WithSub(dest, capacity, &length, utf8.data(), srcLength, 0xFFFD, nullptr, &status);
    };

    convert(nullptr, 0);
    if (status == U_BUFFER_OVERFLOW_ERROR) status = U_ZERO_ERROR;
    if (U_FAILURE(status)) throw CodecError(fmt::format("Input is not valid UTF-8 ({})", u_errorName(status)));

    std::vector<UChar> out(static_cast<size_t>(length) + 1);
    convert(out.data(), icuLength(out.size()));
    if (U_FAILURE(status)) throw CodecError(fmt::format("Input is not valid UTF-8 ({})", u_errorName(status)));

    out.resize(static_cast<size_t>(length));
    return out;
}

}

int32_t icuLength(const size_t size) {
    if (size > static_cast<size_t>(std::numeric_limits<int32_t>::max()))
        throw CodecError(fmt::format("Input of {} bytes is too large to convert", size));
    return static_cast<int32_t>(size);
}

std::string decode(const std::vector<uint8_t>& bytes, const std::string& name, const ErrorPolicy policy) {
    Converter cnv(name);
    if (bytes.empty()) return {};

    UErrorCode status = U_ZERO_ERROR;
    if (policy == ErrorPolicy::Replace)
        ucnv_setToUCallBack(cnv, writeReplacementChar, nullptr, nullptr, nullptr, &status);
    else
        ucnv_setToUCallBack(cnv, UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &status);
    if (U_FAILURE(status))
        throw CodecError(fmt::format("Failed to configure {} decoder: {}", name, u_errorName(status)));

    const icu::UnicodeString text(reinterpret_cast<const char*>(bytes.data()),
                                  icuLength(bytes.size()), cnv, status);
    if (U_FAILURE(status))
        throw CodecError(fmt::format("Invalid byte sequence for {} ({})", name, u_errorName(status)));

    std::string out;
    text.toUTF8String(out);
    return out;
}

std::vector<uint8_t> encode(const std::string& utf8, const std::string& name, const ErrorPolicy policy) {
    Converter cnv(name);
    if (utf8.empty()) return {};

    const auto u16 = utf8ToUtf16(utf8, policy);
    const auto u16Length = icuLength(u16.size());

    UErrorCode status = U_ZERO_ERROR;
    if (policy == ErrorPolicy::Strict)
        ucnv_setFromUCallBack(cnv, UCNV_FROM_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &status);
    else
        ucnv_setFromUCallBack(cnv, UCNV_FROM_U_CALLBACK_SUBSTITUTE, nullptr, nullptr, nullptr, &status);
    if (U_FAILURE(status))
        throw CodecError(fmt::format("Failed to configure {} encoder: {}", name, u_errorName(status)));

    const int32_t length = ucnv_fromUChars(cnv, nullptr, 0, u16.data(), u16Length, &status);
    if (status == U_BUFFER_OVERFLOW_ERROR || status == U_STRING_NOT_TERMINATED_WARNING) status = U_ZERO_ERROR;
    if (U_FAILURE(status))
        throw CodecError(fmt::format("Character not representable in {} ({})", name, u_errorName(status)));

    std::vector<uint8_t> out(static_cast<size_t>(length) + 1);
    const int32_t written = ucnv_fromUChars(cnv, reinterpret_cast<char*>(out.data()),
                                            icuLength(out.size()), u16.data(), u16Length, &status);
    if (U_FAILURE(status))
        throw CodecError(fmt::format("Character not representable in {} ({})", name, u_errorName(status)));

    out.resize(static_cast<size_t>(written));
    return out;
}

}
