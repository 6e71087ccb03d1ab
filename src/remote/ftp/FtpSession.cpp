#include "remote/ftp/FtpSession.hpp"
#include "remote/ftp/mlsd.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <exception>
#include <fmt/core.h>
#include <stdexcept>
#include <string_view>

using namespace fb::remote::ftp;
using namespace fb::remote;
using namespace fb::util;
using namespace fb::log;

namespace {

constexpr long MIN_CURL_BUFFER = 1024;
constexpr long MAX_CURL_BUFFER = 10 * 1024 * 1024;

struct UploadCursor {
    const std::vector<uint8_t>* bytes;
    size_t offset = 0;
};

struct DownloadState {
    const BlockSink* sink;
    std::exception_ptr error;
};

size_t readFromCursor(char* buf, const size_t size, const size_t nmemb, void* ud) {
    auto* cur = static_cast<UploadCursor*>(ud);
    const size_t n = std::min(size * nmemb, cur->bytes->size() - cur->offset);
    std::copy_n(cur->bytes->data() + cur->offset, n, buf);
    cur->offset += n;
    return n;
}

size_t writeToSink(const char* ptr, const size_t size, const size_t nmemb, void* ud) {
    auto* state = static_cast<DownloadState*>(ud);
    try {
        (*state->sink)(reinterpret_cast<const uint8_t*>(ptr), size * nmemb);
    } catch (...) {
        // rethrown after curl_easy_perform returns CURLE_WRITE_ERROR
        state->error = std::current_exception();
        return 0;
    }
    return size * nmemb;
}

std::string escapeSegment(CURL* curl, const std::string& segment) {
    char* esc = curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.length()));
    if (!esc) throw std::runtime_error("curl_easy_escape failed for: " + segment);
    std::string out(esc);
    curl_free(esc);
    return out;
}

}

FtpSession::FtpSession(const std::string& host, const uint16_t port, const Options opts)
    : baseUrl_(host.find("://") == std::string::npos ? "ftp://" + host : host), opts_(opts) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
    if (port != 0) baseUrl_ += ":" + std::to_string(port);
}

FtpSession::~FtpSession() { close(); }

void FtpSession::applyBaseOptions() {
    curl_easy_reset(curl_);
    errBuf_[0] = '\0';
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errBuf_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opts_.connect_timeout_seconds));
    curl_easy_setopt(curl_, CURLOPT_USERNAME, user_.c_str());
    curl_easy_setopt(curl_, CURLOPT_PASSWORD, password_.c_str());
    curl_easy_setopt(curl_, CURLOPT_FTP_USE_EPSV, 1L);
    if (opts_.use_tls) curl_easy_setopt(curl_, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
}

void FtpSession::perform(const std::string& op, const std::string& path) {
    const CURLcode res = curl_easy_perform(curl_);
    if (res == CURLE_OK) return;

    long response = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response);
    const std::string detail = errBuf_[0] ? std::string(errBuf_) : std::string(curl_easy_strerror(res));

    throw std::runtime_error(fmt::format("FTP {} {} failed: {} (curl {}, reply {})",
                                         op, path, detail, static_cast<int>(res), response));
}

std::string FtpSession::urlFor(const std::string& path, const bool isDir) const {
    std::string url = baseUrl_ + "/";
    std::string_view rest = path;
    const bool absolute = !rest.empty() && rest.front() == '/';
    if (absolute) {
        url += "%2F";
        rest.remove_prefix(1);
    }

    bool needsSeparator = absolute;
    while (!rest.empty()) {
        const auto slash = rest.find('/');
        const auto segment = std::string(rest.substr(0, slash));
        rest.remove_prefix(slash == std::string_view::npos ? rest.size() : slash + 1);
        if (segment.empty()) continue;

        if (needsSeparator) url += '/';
        url += escapeSegment(curl_, segment);
        needsSeparator = true;
    }

    if (isDir && url.back() != '/') url += '/';
    return url;
}

void FtpSession::authenticate(const std::string& user, const std::string& password) {
    if (!curl_.valid()) throw std::runtime_error("FTP session already closed");

    user_ = user;
    password_ = password;
    applyBaseOptions();

    // connect, log in and CWD to the login directory, transfer nothing
    curl_easy_setopt(curl_, CURLOPT_URL, (baseUrl_ + "/").c_str());
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    perform("login", baseUrl_);

    Registry::remote()->debug("[FtpSession] Logged in to {} as {}", baseUrl_, user_);
}

std::vector<RemoteEntry> FtpSession::listChildren(const std::string& path) {
    if (!curl_.valid()) throw std::runtime_error("FTP session already closed");

    std::string listing;
    applyBaseOptions();
    const auto url = urlFor(path, true);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "MLSD");
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &listing);
    perform("MLSD", path);

    return parseMlsd(listing);
}

void FtpSession::download(const std::string& path, const size_t blockSize, const BlockSink& sink) {
    if (!curl_.valid()) throw std::runtime_error("FTP session already closed");

    DownloadState state{&sink, nullptr};
    applyBaseOptions();
    const auto url = urlFor(path, false);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_BUFFERSIZE,
                     std::clamp(static_cast<long>(blockSize), MIN_CURL_BUFFER, MAX_CURL_BUFFER));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToSink);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &state);

    try {
        perform("RETR", path);
    } catch (const std::runtime_error&) {
        if (state.error) std::rethrow_exception(state.error);
        throw;
    }
}

void FtpSession::upload(const std::string& path, const std::vector<uint8_t>& bytes) {
    if (!curl_.valid()) throw std::runtime_error("FTP session already closed");

    UploadCursor cursor{&bytes, 0};
    applyBaseOptions();
    const auto url = urlFor(path, false);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_, CURLOPT_READFUNCTION, readFromCursor);
    curl_easy_setopt(curl_, CURLOPT_READDATA, &cursor);
    curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(bytes.size()));
    perform("STOR", path);
}

void FtpSession::close() {
    curl_.reset();
}

FtpConnector::FtpConnector(const config::RemoteConfig& cfg)
    : opts_{cfg.use_tls, cfg.connect_timeout_seconds} {}

std::unique_ptr<Session> FtpConnector::connect(const std::string& host, const uint16_t port) {
    return std::make_unique<FtpSession>(host, port, opts_);
}
