#include "core/GitClient.hpp"

#include "util/Logger.hpp"
#include "util/StringUtil.hpp"

namespace havc {

GitClient::GitClient(Config config, std::shared_ptr<IProcessRunner> runner)
    : config_(std::move(config)), runner_(std::move(runner)) {}

Expected<ProcessOutput> GitClient::exec(const std::vector<std::string>& args) const {
    if (!runner_) return Error{ErrorCode::InternalError, "GitClient has no process runner"};

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(config_.gitBinary);
    argv.insert(argv.end(), args.begin(), args.end());

    Logger::instance().debug("git " + strings::join(args, " ") + " (in " + config_.root.string() + ")");

    RunOptions options;
    options.timeoutMs = config_.timeoutMs;
    options.maxOutputBytes = config_.maxOutputBytes;
    return runner_->run(argv, config_.root, options);
}

Expected<std::string> GitClient::raw(const std::vector<std::string>& args) const {
    auto res = exec(args);
    if (!res) return res.error();
    return std::move(res.value().stdoutText);
}

Expected<History<CommitRecord>> GitClient::log(const LogOptions& options) const {
    if (options.maxCount <= 0) {
        return Error{ErrorCode::InvalidArgs, "log: max count must be positive, got " + std::to_string(options.maxCount)};
    }
    auto out = raw(HistoryParser::fullLogArgs(options));
    if (!out) return out.error();
    return HistoryParser::parseFullLog(out.value(), !options.file.empty());
}

std::future<Expected<History<CommitRecord>>> GitClient::logAsync(LogOptions options) const {
    // Copies of config and runner keep the task valid if this client goes away first
    GitClient self(config_, runner_);
    return std::async(std::launch::async, [self, options] { return self.log(options); });
}

Expected<History<LightweightCommitRecord>> GitClient::lightweightLog() const {
    auto out = raw(HistoryParser::lightweightLogArgs());
    if (!out) return out.error();
    return HistoryParser::parseLightweightLog(out.value());
}

std::future<Expected<History<LightweightCommitRecord>>> GitClient::lightweightLogAsync() const {
    GitClient self(config_, runner_);
    return std::async(std::launch::async, [self] { return self.lightweightLog(); });
}

Expected<WorkTreeStatus> GitClient::status() const {
    auto out = raw({"status", "--porcelain", "--branch"});
    if (!out) return out.error();
    return StatusParser::parsePorcelainStatus(out.value());
}

Expected<std::string> GitClient::showFileAtCommit(const std::string& revision, const std::string& path) const {
    // Passed as one argv element, so spaces in the path need no quoting
    return raw({"show", revision + ":" + path});
}

Expected<std::string> GitClient::commitDetails(const std::string& revision) const {
    return raw({"show", "--name-status", "--oneline", revision});
}

Expected<std::string> GitClient::diff(const std::vector<std::string>& args) const {
    std::vector<std::string> full{"diff"};
    full.insert(full.end(), args.begin(), args.end());
    return raw(full);
}

Expected<std::vector<std::string>> GitClient::listBranches() const {
    auto out = raw({"branch"});
    if (!out) return out.error();
    return StatusParser::parseBranchList(out.value());
}

Expected<std::string> GitClient::revParse(const std::vector<std::string>& args) const {
    std::vector<std::string> full{"rev-parse"};
    full.insert(full.end(), args.begin(), args.end());
    auto out = raw(full);
    if (!out) return out.error();
    return strings::trim(out.value());
}

bool GitClient::isRepository() const {
    auto out = exec({"rev-parse", "--is-inside-work-tree"});
    if (!out) {
        Logger::instance().debug("Not a git work tree: " + out.error().message);
        return false;
    }
    return true;
}

Expected<void> GitClient::init() const {
    auto res = exec({"init"});
    if (!res) return res.error();
    return {};
}

Expected<void> GitClient::add(const std::vector<std::string>& files) const {
    if (files.empty()) return Error{ErrorCode::InvalidArgs, "add: nothing specified"};
    std::vector<std::string> full{"add", "--"};
    full.insert(full.end(), files.begin(), files.end());
    auto res = exec(full);
    if (!res) return res.error();
    return {};
}

Expected<void> GitClient::commit(const std::string& message) const {
    auto res = exec({"commit", "-m", message});
    if (!res) return res.error();
    return {};
}

Expected<void> GitClient::branch(const std::vector<std::string>& args) const {
    std::vector<std::string> full{"branch"};
    full.insert(full.end(), args.begin(), args.end());
    auto res = exec(full);
    if (!res) return res.error();
    return {};
}

Expected<void> GitClient::checkout(const std::vector<std::string>& args) const {
    std::vector<std::string> full{"checkout"};
    full.insert(full.end(), args.begin(), args.end());
    auto res = exec(full);
    if (!res) return res.error();
    return {};
}

bool GitClient::rmCached(const std::string& path) const {
    auto res = exec({"rm", "--cached", "-f", path});
    if (!res) {
        Logger::instance().debug("rm --cached " + path + " refused: " + res.error().message);
        return false;
    }
    return true;
}

bool GitClient::resetHead(const std::string& path) const {
    auto res = exec({"reset", "HEAD", "--", path});
    if (!res) {
        Logger::instance().debug("reset HEAD " + path + " refused: " + res.error().message);
        return false;
    }
    return true;
}

}
