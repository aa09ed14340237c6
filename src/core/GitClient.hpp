#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "core/CommitRecord.hpp"
#include "core/Config.hpp"
#include "core/HistoryParser.hpp"
#include "core/ProcessRunner.hpp"
#include "core/StatusParser.hpp"
#include "util/Expected.hpp"

namespace havc {

/**
 * @brief Facade over the git binary for one working directory
 *
 * Every call starts one git process in `config.root` with the configured
 * timeout and output cap, and returns either parsed data or the runner's
 * error unchanged. The client keeps no state between calls, so a single
 * instance may be shared by threads.
 *
 * Every call blocks the calling thread until git exits. The *Async
 * variants run the history reads on std::async; for the other queries
 * callers that must not block run them on their own thread.
 */
class GitClient {
public:
    GitClient(Config config, std::shared_ptr<IProcessRunner> runner);

    const Config& config() const { return config_; }

    /// Run `git <args>` and return both streams
    Expected<ProcessOutput> exec(const std::vector<std::string>& args) const;

    /// Run `git <args>` and return stdout only
    Expected<std::string> raw(const std::vector<std::string>& args) const;

    // History
    Expected<History<CommitRecord>> log(const LogOptions& options = {}) const;
    std::future<Expected<History<CommitRecord>>> logAsync(LogOptions options = {}) const;
    Expected<History<LightweightCommitRecord>> lightweightLog() const;
    std::future<Expected<History<LightweightCommitRecord>>> lightweightLogAsync() const;

    // Read-only queries
    Expected<WorkTreeStatus> status() const;
    Expected<std::string> showFileAtCommit(const std::string& revision, const std::string& path) const;
    Expected<std::string> commitDetails(const std::string& revision) const;
    Expected<std::string> diff(const std::vector<std::string>& args) const;
    Expected<std::vector<std::string>> listBranches() const;
    Expected<std::string> revParse(const std::vector<std::string>& args) const;
    bool isRepository() const;

    // Mutating pass-throughs
    Expected<void> init() const;
    Expected<void> add(const std::vector<std::string>& files) const;
    Expected<void> commit(const std::string& message) const;
    Expected<void> branch(const std::vector<std::string>& args) const;
    Expected<void> checkout(const std::vector<std::string>& args) const;

    /// `git rm --cached -f <path>`; false when git refuses (e.g. path not in the index)
    bool rmCached(const std::string& path) const;

    /// `git reset HEAD -- <path>`; false when git refuses (e.g. no HEAD yet)
    bool resetHead(const std::string& path) const;

private:
    Config config_;
    std::shared_ptr<IProcessRunner> runner_;
};

}
