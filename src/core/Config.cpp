#include "core/Config.hpp"

#include <charconv>
#include <cstdlib>

namespace fs = std::filesystem;

namespace havc {

namespace {

template <typename T>
bool parsePositive(const std::string& text, T& out) {
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value <= 0) return false;
    out = value;
    return true;
}

Expected<void> setTimeout(Config& cfg, const std::string& text, const char* source) {
    if (!parsePositive(text, cfg.timeoutMs)) {
        return Error{ErrorCode::InvalidArgs, std::string(source) + ": timeout must be a positive integer, got '" + text + "'"};
    }
    return {};
}

Expected<void> setMaxOutput(Config& cfg, const std::string& text, const char* source) {
    if (!parsePositive(text, cfg.maxOutputBytes)) {
        return Error{ErrorCode::InvalidArgs, std::string(source) + ": output cap must be a positive integer, got '" + text + "'"};
    }
    return {};
}

fs::path absoluteRoot(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) return p.lexically_normal();
    return abs.lexically_normal();
}

}

Expected<Config> Config::fromEnvironment() {
    Config cfg;
    std::error_code ec;
    cfg.root = fs::current_path(ec);
    if (ec) return Error{ErrorCode::IoError, "Cannot determine current directory: " + ec.message()};

    if (const char* root = std::getenv("HAVC_ROOT"); root && *root) {
        cfg.root = absoluteRoot(root);
    }
    if (const char* git = std::getenv("HAVC_GIT"); git && *git) {
        cfg.gitBinary = git;
    }
    if (const char* t = std::getenv("HAVC_TIMEOUT_MS"); t && *t) {
        auto res = setTimeout(cfg, t, "HAVC_TIMEOUT_MS");
        if (!res) return res.error();
    }
    if (const char* m = std::getenv("HAVC_MAX_OUTPUT_BYTES"); m && *m) {
        auto res = setMaxOutput(cfg, m, "HAVC_MAX_OUTPUT_BYTES");
        if (!res) return res.error();
    }
    return cfg;
}

Expected<std::vector<std::string>> Config::applyArgs(const std::vector<std::string>& args) {
    size_t i = 0;
    while (i < args.size()) {
        const std::string& flag = args[i];
        if (flag == "-v" || flag == "--verbose") {
            verbose = true;
            ++i;
            continue;
        }
        if (flag != "--root" && flag != "--git" && flag != "--timeout-ms" && flag != "--max-output") {
            break;
        }
        if (i + 1 >= args.size()) {
            return Error{ErrorCode::InvalidArgs, flag + " requires a value"};
        }
        const std::string& value = args[i + 1];
        if (flag == "--root") {
            root = absoluteRoot(value);
        } else if (flag == "--git") {
            gitBinary = value;
        } else if (flag == "--timeout-ms") {
            auto res = setTimeout(*this, value, "--timeout-ms");
            if (!res) return res.error();
        } else {
            auto res = setMaxOutput(*this, value, "--max-output");
            if (!res) return res.error();
        }
        i += 2;
    }
    return std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
}

}
