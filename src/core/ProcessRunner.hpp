#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace havc {

struct RunOptions {
    int timeoutMs{Constants::DEFAULT_TIMEOUT_MS};
    size_t maxOutputBytes{Constants::DEFAULT_MAX_OUTPUT_BYTES};   // per stream
};

struct ProcessOutput {
    std::string stdoutText;
    std::string stderrText;
    int exitCode{0};
};

/**
 * @brief Strategy interface for running an external program
 *
 * Contract for implementations:
 *   - argv[0] is the program; it is looked up on PATH, no shell is involved
 *   - the child runs with `cwd` as its working directory
 *   - nonzero exit   -> ErrorCode::ExternalToolFailed (exitCode, toolStderr set)
 *   - deadline hit   -> ErrorCode::Timeout, child killed
 *   - cap exceeded   -> ErrorCode::OutputTooLarge, child killed
 *   - cannot start   -> ErrorCode::SpawnFailed
 *
 * No retries are performed at this level or above it.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    virtual Expected<ProcessOutput> run(const std::vector<std::string>& argv,
                                        const std::filesystem::path& cwd,
                                        const RunOptions& options) = 0;
};

/**
 * @brief fork/exec implementation with poll-driven pipe draining
 *
 * Both pipes are drained concurrently so a child filling stderr cannot
 * deadlock against a parent waiting on stdout.
 */
class PosixProcessRunner : public IProcessRunner {
public:
    Expected<ProcessOutput> run(const std::vector<std::string>& argv,
                                const std::filesystem::path& cwd,
                                const RunOptions& options) override;
};

}
