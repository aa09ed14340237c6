#include "cli/commands/InitCommand.hpp"

#include <iostream>

namespace havc {

Expected<void> InitCommand::execute(const AppContext& ctx, const std::vector<std::string>&) {
    GitClient git = ctx.git();
    if (git.isRepository()) {
        std::cout << "Git repository is already initialised in " << ctx.config.root.string() << "\n";
        return {};
    }
    auto res = git.init();
    if (!res) return res;
    std::cout << "Initialized empty Git repository in " << ctx.config.root.string() << "/.git/\n";
    return {};
}

}
