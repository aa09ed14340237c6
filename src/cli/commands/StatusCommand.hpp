#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class StatusCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "status"; }
    const char* description() const override { return "Show working tree status"; }
    const char* helpNameLine() const override { return "status -  Show the working tree status"; }
    const char* helpSynopsis() const override { return "havc status"; }
    const char* helpDescription() const override { return "Show the current branch and every staged, modified, untracked or conflicted path."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
