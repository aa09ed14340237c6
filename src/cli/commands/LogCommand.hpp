#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class LogCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "log"; }
    const char* description() const override { return "Show commit history"; }
    const char* helpNameLine() const override { return "log -  Show commit logs"; }
    const char* helpSynopsis() const override { return "havc log [--max-count <n>] [--file <path>] [--oneline]"; }
    const char* helpDescription() const override { return "Show up to 500 commits, newest first. With --file, only commits touching that path are listed together with how they changed it (A, M or D)."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--max-count <n>", "Limit the number of commits (default 500)."}, {"--file <path>", "Only commits that touched <path>, with its change status."}, {"--oneline", "Condense each commit to a single line."} };
    }
};

}
