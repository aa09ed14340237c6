#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class ShowCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "show"; }
    const char* description() const override { return "Show a file at a revision or a commit summary"; }
    const char* helpNameLine() const override { return "show -  Show file content at a revision"; }
    const char* helpSynopsis() const override { return "havc show <revision> [<path>]"; }
    const char* helpDescription() const override { return "With a path, print the file as it was at <revision>. Without one, print the commit summary and the files it changed."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
