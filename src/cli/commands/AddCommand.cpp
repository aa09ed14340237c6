#include "cli/commands/AddCommand.hpp"

#include <iostream>

namespace havc {

Expected<void> AddCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        return Error{ErrorCode::InvalidArgs, "Nothing specified, nothing added."};
    }
    auto res = ctx.git().add(args);
    if (!res) return res;
    for (const auto& p : args) {
        std::cout << "Staged: " << p << "\n";
    }
    return {};
}

}
