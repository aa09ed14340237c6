#include "cli/commands/StatusCommand.hpp"

#include <iostream>

namespace havc {

namespace {

/// Human label for a porcelain column letter
const char* describeCode(char code) {
    switch (code) {
        case 'M': return "modified";
        case 'T': return "typechange";
        case 'A': return "new file";
        case 'D': return "deleted";
        case 'R': return "renamed";
        case 'C': return "copied";
        case 'U': return "unmerged";
        default: return "changed";
    }
}

std::string displayPath(const StatusEntry& e) {
    if (e.originalPath.empty()) return e.path;
    return e.originalPath + " -> " + e.path;
}

}

/**
 * @brief Execute 'havc status'
 *
 * Groups porcelain entries the way git's long format does:
 *   - Unmerged paths:        conflicted pairs
 *   - Changes to be committed: index column set
 *   - Changes not staged:      working-tree column set
 *   - Untracked files:         "??"
 */
Expected<void> StatusCommand::execute(const AppContext& ctx, const std::vector<std::string>&) {
    auto res = ctx.git().status();
    if (!res) return res.error();
    const WorkTreeStatus& st = res.value();

    std::cout << "On branch " << st.branch << "\n";
    if (st.isClean()) {
        std::cout << "nothing to commit, working tree clean\n";
        return {};
    }

    std::vector<const StatusEntry*> conflicted, staged, unstaged, untracked;
    for (const auto& e : st.files) {
        if (e.isUntracked()) {
            untracked.push_back(&e);
        } else if (e.isConflicted()) {
            conflicted.push_back(&e);
        } else {
            if (e.index != ' ') staged.push_back(&e);
            if (e.workingDir != ' ') unstaged.push_back(&e);
        }
    }

    if (!conflicted.empty()) {
        std::cout << "\nUnmerged paths:\n";
        for (const auto* e : conflicted) std::cout << "\t\033[31mboth modified:   " << e->path << "\033[0m\n";
    }
    if (!staged.empty()) {
        std::cout << "\nChanges to be committed:\n";
        for (const auto* e : staged) {
            std::cout << "\t\033[32m" << describeCode(e->index) << ":   " << displayPath(*e) << "\033[0m\n";
        }
    }
    if (!unstaged.empty()) {
        std::cout << "\nChanges not staged for commit:\n";
        for (const auto* e : unstaged) {
            std::cout << "\t\033[31m" << describeCode(e->workingDir) << ":   " << e->path << "\033[0m\n";
        }
    }
    if (!untracked.empty()) {
        std::cout << "\nUntracked files:\n";
        for (const auto* e : untracked) std::cout << "\t\033[31m" << e->path << "\033[0m\n";
    }
    return {};
}

}
