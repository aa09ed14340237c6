#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class CommitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "commit"; }
    const char* description() const override { return "Record staged changes"; }
    const char* helpNameLine() const override { return "commit -  Record changes to the repository"; }
    const char* helpSynopsis() const override { return "havc commit -m <msg> [-m <msg>]..."; }
    const char* helpDescription() const override { return "Create a commit from the staged changes. Multiple -m values become separate paragraphs."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"-m <msg>", "Commit message paragraph (required)."} };
    }
};

}
