#include "core/StatusParser.hpp"

#include "core/Constants.hpp"
#include "util/StringUtil.hpp"

namespace havc {

bool StatusEntry::isConflicted() const {
    // Unmerged pairs per git-status(1): DD, AU, UD, UA, DU, AA, UU
    if (index == 'U' || workingDir == 'U') return true;
    return (index == 'A' && workingDir == 'A') || (index == 'D' && workingDir == 'D');
}

std::vector<std::string> WorkTreeStatus::conflicted() const {
    std::vector<std::string> out;
    for (const auto& f : files) {
        if (f.isConflicted()) out.push_back(f.path);
    }
    return out;
}

namespace {

std::string branchFromHeader(const std::string& header) {
    // header is the text after "## "
    static const char* const unbornPrefixes[] = {"No commits yet on ", "Initial commit on "};
    for (const char* prefix : unbornPrefixes) {
        if (strings::startsWith(header, prefix)) {
            return strings::trim(header.substr(std::string(prefix).size()));
        }
    }
    if (strings::startsWith(header, "HEAD (no branch)")) return "HEAD";

    std::string name = header;
    size_t space = name.find(' ');
    if (space != std::string::npos) name = name.substr(0, space);
    size_t dots = name.find("...");
    if (dots != std::string::npos) name = name.substr(0, dots);
    return name;
}

}

namespace StatusParser {

WorkTreeStatus parsePorcelainStatus(const std::string& raw) {
    WorkTreeStatus status;
    status.branch = Constants::DEFAULT_BRANCH;

    for (std::string line : strings::splitLines(raw)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (strings::startsWith(line, "## ")) {
            std::string name = branchFromHeader(line.substr(3));
            if (!name.empty()) status.branch = name;
            continue;
        }
        if (strings::trim(line).empty()) continue;
        if (line.size() < 4) continue;

        StatusEntry entry;
        entry.index = line[0];
        entry.workingDir = line[1];
        std::string path = line.substr(3);
        size_t arrow = path.find(" -> ");
        if (arrow != std::string::npos) {
            entry.originalPath = path.substr(0, arrow);
            path = path.substr(arrow + 4);
        }
        entry.path = path;
        status.files.push_back(std::move(entry));
    }
    return status;
}

std::vector<std::string> parseBranchList(const std::string& raw) {
    std::vector<std::string> branches;
    for (const auto& line : strings::splitLines(raw)) {
        std::string name = strings::trim(line);
        if (strings::startsWith(name, "* ")) name = strings::trim(name.substr(2));
        if (name.empty()) continue;
        branches.push_back(name);
    }
    return branches;
}

}

}
