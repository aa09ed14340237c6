#include "cli/commands/CommitCommand.hpp"

#include <iostream>

#include "util/StringUtil.hpp"

namespace havc {

/**
 * @brief Execute 'havc commit'
 *
 * Each -m <msg> is one paragraph; paragraphs are joined with a blank line
 * so `-m "Subject" -m "Body"` yields a subject and a body.
 */
Expected<void> CommitCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> messageParts;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-m") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "switch 'm' requires a value"};
            }
            messageParts.push_back(args[i + 1]);
            ++i;
        } else {
            return Error{ErrorCode::InvalidArgs, "unknown option: " + args[i]};
        }
    }

    if (messageParts.empty()) {
        return Error{ErrorCode::InvalidArgs, "Aborting commit due to empty commit message (use -m <msg>)"};
    }

    GitClient git = ctx.git();
    auto res = git.commit(strings::join(messageParts, "\n\n"));
    if (!res) return res;

    auto head = git.revParse({"--short", "HEAD"});
    if (head) {
        std::cout << "[" << head.value() << "] " << messageParts.front() << "\n";
    } else {
        std::cout << messageParts.front() << "\n";
    }
    return {};
}

}
