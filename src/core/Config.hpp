#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace havc {

/**
 * @brief Settings every git invocation runs under
 *
 * Built once at startup and passed by value to GitClient and SafeRestore.
 * Nothing in the library reads the process working directory after this
 * point; all paths resolve against `root`.
 *
 * Sources, later ones winning:
 *   defaults -> HAVC_ROOT / HAVC_GIT / HAVC_TIMEOUT_MS / HAVC_MAX_OUTPUT_BYTES
 *            -> leading global CLI flags
 */
struct Config {
    std::filesystem::path root;
    std::string gitBinary{Constants::DEFAULT_GIT_BINARY};
    int timeoutMs{Constants::DEFAULT_TIMEOUT_MS};
    size_t maxOutputBytes{Constants::DEFAULT_MAX_OUTPUT_BYTES};
    bool verbose{false};

    /// Defaults overlaid with environment variables; root defaults to the current directory
    static Expected<Config> fromEnvironment();

    /**
     * @brief Consume leading global flags from a CLI argument list
     * @param args Arguments after the program name
     * @return Remaining arguments (command name first), or InvalidArgs
     *
     * Recognized: --root <dir>, --git <bin>, --timeout-ms <n>, --max-output <n>, -v/--verbose.
     * Stops at the first argument that is not a global flag.
     */
    Expected<std::vector<std::string>> applyArgs(const std::vector<std::string>& args);
};

}
