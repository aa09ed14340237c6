#include "cli/commands/GraphCommand.hpp"

#include <iostream>

namespace havc {

namespace {

std::string shorten(const std::string& hash) {
    return hash.size() > 7 ? hash.substr(0, 7) : hash;
}

}

Expected<void> GraphCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "graph takes no arguments"};
    }
    auto res = ctx.git().lightweightLog();
    if (!res) return res.error();
    const auto& history = res.value();

    if (history.empty()) {
        std::cout << "`your current branch does not have any commits yet`\n";
        return {};
    }
    for (const auto& c : history.all()) {
        std::cout << (c.isMerge() ? "M " : "* ") << "\033[33m" << shorten(c.hash) << "\033[0m " << c.date;
        if (c.isRoot()) {
            std::cout << " (root)";
        } else {
            std::cout << " <-";
            for (const auto& p : c.parents) std::cout << " " << shorten(p);
        }
        std::cout << "  " << c.subject << "\n";
    }
    std::cout << history.total() << " commit(s)\n";
    return {};
}

}
