#include "cli/commands/DiffCommand.hpp"

#include <iostream>

namespace havc {

Expected<void> DiffCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto res = ctx.git().diff(args);
    if (!res) return res.error();
    std::cout << res.value();
    return {};
}

}
