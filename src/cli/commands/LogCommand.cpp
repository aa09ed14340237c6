#include "cli/commands/LogCommand.hpp"

#include <charconv>
#include <iostream>
#include <sstream>

#include "util/StringUtil.hpp"

namespace havc {

namespace {

const char* describeStatus(FileStatus status) {
    switch (status) {
        case FileStatus::Added: return "added";
        case FileStatus::Modified: return "modified";
        case FileStatus::Deleted: return "deleted";
        case FileStatus::Unknown: break;
    }
    return "";
}

void printFull(const CommitRecord& c) {
    std::cout << "\033[33mcommit " << c.hash << "\033[0m\n";
    std::cout << "Author: " << c.authorName << " <" << c.authorEmail << ">\n";
    std::cout << "Date:   " << strings::formatIso8601(c.timestamp) << "\n";
    if (c.status != FileStatus::Unknown) {
        std::cout << "Change: " << fileStatusCode(c.status) << " (" << describeStatus(c.status) << ")\n";
    }
    std::cout << "\n    " << c.subject << "\n";
    if (!c.body.empty()) {
        std::cout << "\n";
        std::istringstream iss(c.body);
        std::string line;
        while (std::getline(iss, line)) {
            std::cout << "    " << line << "\n";
        }
    }
    std::cout << "\n";
}

void printOneline(const CommitRecord& c) {
    std::cout << "\033[33m" << c.shortHash << "\033[0m ";
    if (c.status != FileStatus::Unknown) std::cout << fileStatusCode(c.status) << " ";
    std::cout << c.subject << "\n";
}

}

/**
 * @brief Execute 'havc log'
 *
 * Lists commits newest first (git's order). Options:
 *   --max-count <n> / -n <n>  limit (default 500)
 *   --file <path>             restrict to one path and show its A/M/D status
 *   --oneline                 "<short> [status] <subject>"
 */
Expected<void> LogCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    LogOptions options;
    bool oneline = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--oneline") {
            oneline = true;
        } else if (a == "--max-count" || a == "-n") {
            if (i + 1 >= args.size()) return Error{ErrorCode::InvalidArgs, a + " requires a value"};
            const std::string& v = args[++i];
            int n = 0;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
            if (ec != std::errc() || ptr != v.data() + v.size() || n <= 0) {
                return Error{ErrorCode::InvalidArgs, "invalid --max-count: " + v};
            }
            options.maxCount = n;
        } else if (a == "--file") {
            if (i + 1 >= args.size()) return Error{ErrorCode::InvalidArgs, "--file requires a path"};
            options.file = args[++i];
        } else {
            return Error{ErrorCode::InvalidArgs, "unknown option: " + a};
        }
    }

    auto res = ctx.git().log(options);
    if (!res) return res.error();
    const auto& history = res.value();

    if (history.empty()) {
        std::cout << "`your current branch does not have any commits yet`\n";
        return {};
    }
    for (const auto& c : history.all()) {
        if (oneline) {
            printOneline(c);
        } else {
            printFull(c);
        }
    }
    return {};
}

}
