#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class GraphCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "graph"; }
    const char* description() const override { return "Show commit graph with parents"; }
    const char* helpNameLine() const override { return "graph -  Show the commit graph"; }
    const char* helpSynopsis() const override { return "havc graph"; }
    const char* helpDescription() const override { return "List every commit in date order with its parent hashes. Merge commits show each parent, first parent first."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
