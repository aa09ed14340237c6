#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class AddCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "add"; }
    const char* description() const override { return "Stage files"; }
    const char* helpNameLine() const override { return "add -  Add file contents to the index"; }
    const char* helpSynopsis() const override { return "havc add <path>..."; }
    const char* helpDescription() const override { return "Stage the given paths, relative to the configured root."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<path>", "File or directory to stage."} };
    }
};

}
