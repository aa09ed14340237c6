#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace havc {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        const Error& err = res.error();
        // RestoreFailed was already reported at critical level by the restore engine
        if (err.code != ErrorCode::RestoreFailed) {
            Logger::instance().error(std::string(cmd.name()) + ": " + err.message);
        }
        std::string hint = hintFor(err, ctx);
        if (!hint.empty()) Logger::instance().error(hint);
        return res;
    }
    return {};
}

std::string CommandInvoker::hintFor(const Error& err, const AppContext& ctx) {
    if (err.code != ErrorCode::ExternalToolFailed) return "";
    if (err.toolStderr.find("not a git repository") != std::string::npos) {
        return "hint: " + ctx.config.root.string() + " is not a git repository; run 'havc init' first";
    }
    return "";
}

int CommandInvoker::exitStatus(const Expected<void>& result) {
    if (result) return 0;
    return result.error().code == ErrorCode::RestoreFailed ? 2 : 1;
}

}
