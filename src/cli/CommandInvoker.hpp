#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace havc {

class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// Extra advice for well-known git refusals, or "" when there is none
    static std::string hintFor(const Error& err, const AppContext& ctx);

    /// Process exit status for a command result: 0 ok, 2 RestoreFailed, 1 anything else
    static int exitStatus(const Expected<void>& result);
};

}
