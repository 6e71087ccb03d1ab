#include "encoding/Resolver.hpp"
#include "encoding/Aliases.hpp"
#include "encoding/Codec.hpp"
#include "encoding/Detector.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>

using namespace fb::log;

namespace fb::encoding {

namespace {

constexpr auto* DEFAULT_ENCODING = "utf-8";

std::string asciiHead(const std::vector<uint8_t>& raw) {
    const auto end = raw.begin() + static_cast<std::ptrdiff_t>(std::min(raw.size(), DECLARATION_SCAN_BYTES));
    std::string out;
    out.reserve(static_cast<size_t>(end - raw.begin()));
    std::copy_if(raw.begin(), end, std::back_inserter(out), [](const uint8_t b) { return b < 0x80; });
    return out;
}

std::string trimLower(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    s = s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

}

std::string to_string(const Source source) {
    switch (source) {
        case Source::Declared: return "declared";
        case Source::Detected: return "detected";
        case Source::Default: return "default";
    }
    return "unknown";
}

std::optional<std::string> extractDeclaredCharset(const std::vector<uint8_t>& raw) {
    static const std::regex metaCharset(
        R"re(<meta[^>]+charset=["']?([^"' \t\r\n\f\v;>]+))re", std::regex::icase);
    static const std::regex contentCharset(
        R"re(content=["'][^"']*charset=([^"' \t\r\n\f\v;]+))re", std::regex::icase);

    const std::string head = asciiHead(raw);
    std::smatch m;

    if (std::regex_search(head, m, metaCharset)) return trimLower(m[1].str());
    if (std::regex_search(head, m, contentCharset)) return trimLower(m[1].str());
    return std::nullopt;
}

Decision decide(const std::vector<uint8_t>& raw) {
    if (const auto declared = extractDeclaredCharset(raw); declared && !declared->empty())
        return {canonicalize(*declared), Source::Declared};

    try {
        const Detector detector;
        if (const auto guess = detector.guess(raw))
            return {canonicalize(guess->label), Source::Detected};
    } catch (const std::runtime_error& e) {
        Registry::encoding()->warn("[Resolver] Charset detection unavailable: {}", e.what());
    }

    return {DEFAULT_ENCODING, Source::Default};
}

std::optional<Decoded> resolve(const std::vector<uint8_t>& raw, const bool isTextFile) {
    if (!isTextFile) return std::nullopt;

    const auto decision = decide(raw);

    try {
        return Decoded{decision, decode(raw, decision.encoding, ErrorPolicy::Replace)};
    } catch (const CodecLookupError& e) {
        Registry::encoding()->warn("[Resolver] {} ({} encoding), decoding as {}",
                                   e.what(), to_string(decision.source), DEFAULT_ENCODING);
    } catch (const CodecError& e) {
        Registry::encoding()->warn("[Resolver] Decoding as {} failed: {}, decoding as {}",
                                   decision.encoding, e.what(), DEFAULT_ENCODING);
    }

    return Decoded{{DEFAULT_ENCODING, Source::Default}, decode(raw, DEFAULT_ENCODING, ErrorPolicy::Replace)};
}

}
