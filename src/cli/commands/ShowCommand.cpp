#include "cli/commands/ShowCommand.hpp"

#include <iostream>

namespace havc {

Expected<void> ShowCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        return Error{ErrorCode::InvalidArgs, std::string("usage: ") + helpSynopsis()};
    }
    GitClient git = ctx.git();
    auto res = args.size() == 2 ? git.showFileAtCommit(args[0], args[1]) : git.commitDetails(args[0]);
    if (!res) return res.error();
    std::cout << res.value();
    return {};
}

}
