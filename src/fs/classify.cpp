#include "fs/classify.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>

namespace fb::fs {

namespace {

std::string lowerExtension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::ranges::transform(ext, ext.begin(), [](const unsigned char c) { return std::tolower(c); });
    return ext;
}

}

FileClass classify(const std::string& path) {
    static const std::unordered_set<std::string> textExtensions = {
        ".html", ".htm", ".css", ".js", ".json", ".xml",
        ".txt", ".csv", ".svg", ".md", ".php",
    };

    return textExtensions.contains(lowerExtension(path)) ? FileClass::Text : FileClass::Binary;
}

std::optional<std::string> guessMimeType(const std::string& path) {
    static const std::unordered_map<std::string, std::string> mimeMap = {
        {".html", "text/html"}, {".htm", "text/html"}, {".css", "text/css"},
        {".js", "text/javascript"}, {".json", "application/json"}, {".xml", "text/xml"},
        {".txt", "text/plain"}, {".csv", "text/csv"}, {".md", "text/markdown"},
        {".svg", "image/svg+xml"}, {".png", "image/png"}, {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"}, {".gif", "image/gif"}, {".webp", "image/webp"},
        {".ico", "image/vnd.microsoft.icon"}, {".bmp", "image/bmp"}, {".avif", "image/avif"},
        {".pdf", "application/pdf"}, {".zip", "application/zip"}, {".gz", "application/gzip"},
        {".woff", "font/woff"}, {".woff2", "font/woff2"}, {".ttf", "font/ttf"}, {".otf", "font/otf"},
        {".mp3", "audio/mpeg"}, {".mp4", "video/mp4"}, {".webm", "video/webm"},
    };

    const auto it = mimeMap.find(lowerExtension(path));
    if (it == mimeMap.end()) return std::nullopt;
    return it->second;
}

}
