#include "remote/ftp/mlsd.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>

using namespace fb::log;

namespace fb::remote::ftp {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

bool allDigits(const std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) { return std::isdigit(c); });
}

}

std::vector<RemoteEntry> parseMlsd(const std::string& listing) {
    std::vector<RemoteEntry> out;
    std::istringstream in(listing);
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        // a leading blank is already stripped when curl hands over MLSD output, but not always
        const size_t factsBegin = line.front() == ' ' ? 1 : 0;
        const auto blank = line.find(' ', factsBegin);
        if (blank == std::string::npos) {
            Registry::remote()->warn("[MLSD] Skipping line without a name: {}", line);
            continue;
        }

        RemoteEntry entry;
        entry.name = line.substr(blank + 1);

        const std::string_view facts(line.data() + factsBegin, blank - factsBegin);
        size_t pos = 0;
        while (pos < facts.size()) {
            auto end = facts.find(';', pos);
            if (end == std::string_view::npos) end = facts.size();
            const auto fact = facts.substr(pos, end - pos);
            pos = end + 1;

            const auto eq = fact.find('=');
            if (eq == std::string_view::npos) continue;

            const auto key = toLower(fact.substr(0, eq));
            const auto value = fact.substr(eq + 1);

            if (key == "type") entry.type = toLower(value);
            else if (key == "size" && allDigits(value)) entry.size = std::stoull(std::string(value));
            else if (key == "modify") entry.modify = std::string(value);
        }

        out.push_back(std::move(entry));
    }

    return out;
}

}
