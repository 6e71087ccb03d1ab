#include "auth/csrf.hpp"
#include "bridge/TransferBridge.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "proxy/ImageProxy.hpp"
#include "remote/ftp/FtpSession.hpp"
#include "util/errors.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace fb;
using namespace fb::config;
using namespace fb::bridge;
using namespace fb::proxy;
using fb::log::Registry;

namespace {

constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/ftpbridge/config.yaml";

enum ExitCode { EXIT_OK = 0, EXIT_USAGE = 1, EXIT_REJECTED = 2, EXIT_FAILED = 3 };

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void printUsage() {
    std::cerr << "usage: ftpbridge [-c config.yaml] <command> [args...]\n"
                 "  list <path>\n"
                 "  read <path>\n"
                 "  write <path> [-e encoding]     content is read from stdin\n"
                 "  upload <dir> <local-file>\n"
                 "  csrf-token\n"
                 "  csrf-verify <token>\n"
                 "  generate-image <request.json|->\n"
                 "  health\n";
}

int fail(const int code, const std::string& message) {
    if (Registry::isInitialized()) Registry::ftpbridge()->error("[CLI] {}", message);
    std::cerr << nlohmann::json{{"error", message}}.dump() << std::endl;
    return code;
}

std::string readAll(std::istream& in) {
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::vector<uint8_t> readFileBytes(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw UsageError("Cannot open " + p.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

const std::string& arg(const std::vector<std::string>& args, const size_t i, const char* what) {
    if (i >= args.size()) throw UsageError(fmt::format("Missing argument: {}", what));
    return args[i];
}

nlohmann::json dispatch(const Config& cfg, const std::vector<std::string>& args) {
    const auto& cmd = args.front();

    if (cmd == "health") return health();

    if (cmd == "csrf-token")
        return {{"csrfToken", auth::issueCsrfToken(cfg.csrf.secret, std::time(nullptr))}};

    if (cmd == "csrf-verify") {
        const bool valid = auth::verifyCsrfToken(arg(args, 1, "token"), cfg.csrf.secret, std::time(nullptr),
                                                 std::chrono::seconds(cfg.csrf.token_ttl_seconds));
        return {{"valid", valid}};
    }

    if (cmd == "generate-image") {
        const auto& src = arg(args, 1, "request.json");
        nlohmann::json body;
        try {
            if (src == "-") body = nlohmann::json::parse(readAll(std::cin));
            else {
                std::ifstream in(src);
                if (!in) throw UsageError("Cannot open " + src);
                body = nlohmann::json::parse(in);
            }
        } catch (const nlohmann::json::parse_error& e) {
            throw ProxyError(ProxyError::Kind::InvalidRequest, fmt::format("Invalid request JSON: {}", e.what()));
        }
        return ImageProxy(cfg.image_proxy).generate(body.get<ImageRequest>());
    }

    const TransferBridge bridge(cfg.remote, std::make_shared<remote::ftp::FtpConnector>(cfg.remote));

    if (cmd == "list") return bridge.list(arg(args, 1, "path"));

    if (cmd == "read") return bridge.read(arg(args, 1, "path"));

    if (cmd == "write") {
        const auto& path = arg(args, 1, "path");
        std::optional<std::string> encoding;
        for (size_t i = 2; i < args.size(); ++i) {
            if (args[i] == "-e" || args[i] == "--encoding") encoding = arg(args, ++i, "encoding");
            else throw UsageError("Unknown option: " + args[i]);
        }
        return bridge.write(path, readAll(std::cin), encoding);
    }

    if (cmd == "upload") {
        const auto& dir = arg(args, 1, "dir");
        const std::filesystem::path local = arg(args, 2, "local-file");
        return bridge.uploadBinary(dir, local.filename().string(), readFileBytes(local));
    }

    throw UsageError("Unknown command: " + cmd);
}

}

int main(int argc, char** argv) {
    std::filesystem::path configPath = DEFAULT_CONFIG_PATH;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if ((a == "-c" || a == "--config") && i + 1 < argc) configPath = argv[++i];
        else if (a == "-h" || a == "--help") {
            printUsage();
            return EXIT_OK;
        } else args.push_back(a);
    }

    if (args.empty()) {
        printUsage();
        return EXIT_USAGE;
    }

    Config cfg;
    try {
        cfg = loadConfig(configPath);
        Registry::init(cfg.logging);
    } catch (const std::exception& e) {
        return fail(EXIT_USAGE, fmt::format("Failed to initialize: {}", e.what()));
    }

    Registry::ftpbridge()->debug("[CLI] Running '{}' with config {}", args.front(), nlohmann::json(cfg).dump());

    try {
        std::cout << dispatch(cfg, args).dump() << std::endl;
        return EXIT_OK;
    } catch (const UsageError& e) {
        printUsage();
        return fail(EXIT_USAGE, e.what());
    } catch (const InvalidPath& e) {
        return fail(EXIT_REJECTED, e.what());
    } catch (const EncodeError& e) {
        return fail(EXIT_REJECTED, e.what());
    } catch (const TransferError& e) {
        return fail(EXIT_FAILED, e.what());
    } catch (const ProxyError& e) {
        switch (e.kind()) {
            case ProxyError::Kind::NotConfigured: return fail(EXIT_USAGE, e.what());
            case ProxyError::Kind::InvalidRequest: return fail(EXIT_REJECTED, e.what());
            case ProxyError::Kind::Upstream: return fail(EXIT_FAILED, e.what());
        }
        return fail(EXIT_FAILED, e.what());
    } catch (const std::exception& e) {
        return fail(EXIT_FAILED, fmt::format("Unexpected error: {}", e.what()));
    }
}
