#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class DiffCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "diff"; }
    const char* description() const override { return "Show changes"; }
    const char* helpNameLine() const override { return "diff -  Show changes between commits and the working tree"; }
    const char* helpSynopsis() const override { return "havc diff [<git diff args>...]"; }
    const char* helpDescription() const override { return "Pass the arguments to git diff and print the result."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
