#pragma once

#include <string>
#include <vector>

namespace havc {

/// One line of `git status --porcelain`
struct StatusEntry {
    std::string path;
    char index{' '};        // X column: staged state
    char workingDir{' '};   // Y column: working tree state
    std::string originalPath;   // Source path of a rename/copy, empty otherwise

    bool isUntracked() const { return index == '?' && workingDir == '?'; }
    bool isConflicted() const;
};

/// Working tree summary built from `git status --porcelain --branch`
struct WorkTreeStatus {
    std::string branch;
    std::vector<StatusEntry> files;

    bool isClean() const { return files.empty(); }
    std::vector<std::string> conflicted() const;
};

namespace StatusParser {

/**
 * @brief Parse porcelain v1 status with a branch header
 *
 * "## main...origin/main [ahead 1]" -> branch "main"
 * "## No commits yet on main"       -> branch "main"
 * "## HEAD (no branch)"             -> branch "HEAD"
 * Without a header the branch is "master".
 */
WorkTreeStatus parsePorcelainStatus(const std::string& raw);

/// Branch names from `git branch`, current-branch marker removed
std::vector<std::string> parseBranchList(const std::string& raw);

}

}
