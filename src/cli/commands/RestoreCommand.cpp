#include "cli/commands/RestoreCommand.hpp"

#include <iostream>

#include "core/SafeRestore.hpp"

namespace havc {

/**
 * @brief Execute 'havc restore <revision> <path>'
 *
 * Replaces the working-tree file with its content at <revision> using
 * SafeRestore. On failure the old content is written back; if that also
 * fails the error is RestoreFailed and main() exits with status 2.
 *
 * Usage:
 *   havc restore 3f2a9c1 automations.yaml
 *   havc restore HEAD~2 packages/lights.yaml
 */
Expected<void> RestoreCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return Error{ErrorCode::InvalidArgs, std::string("usage: ") + helpSynopsis()};
    }
    const std::string& revision = args[0];
    const std::string& path = args[1];

    SafeRestore restorer(ctx.git(), ctx.files);
    auto res = restorer.restore(revision, path);
    if (!res) {
        if (res.error().code == ErrorCode::RestoreRolledBack) {
            std::cerr << "restore: " << path << " was left unchanged\n";
        }
        return res;
    }
    std::cout << "Restored " << path << " to " << revision << "\n";
    return {};
}

}
