#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class BranchCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "branch"; }
    const char* description() const override { return "List or create branches"; }
    const char* helpNameLine() const override { return "branch -  List, create, or delete branches"; }
    const char* helpSynopsis() const override { return "havc branch [<git branch args>...]"; }
    const char* helpDescription() const override { return "Without arguments, list local branches. Otherwise pass the arguments to git branch."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
