#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class InitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "init"; }
    const char* description() const override { return "Create a git repository in the root"; }
    const char* helpNameLine() const override { return "init -  Initialize the configuration repository"; }
    const char* helpSynopsis() const override { return "havc init"; }
    const char* helpDescription() const override { return "Run git init in the configured root directory. Safe to run on an existing repository."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
