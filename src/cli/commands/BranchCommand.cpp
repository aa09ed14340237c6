#include "cli/commands/BranchCommand.hpp"

#include <iostream>

namespace havc {

Expected<void> BranchCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    GitClient git = ctx.git();
    if (!args.empty()) {
        return git.branch(args);
    }
    auto res = git.listBranches();
    if (!res) return res.error();
    for (const auto& b : res.value()) {
        std::cout << b << "\n";
    }
    return {};
}

}
