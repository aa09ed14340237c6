#pragma once

#include "cli/ICommand.hpp"

namespace havc {

class RestoreCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "restore"; }
    const char* description() const override { return "Restore a file to an earlier revision"; }
    const char* helpNameLine() const override { return "restore -  Restore a working tree file from history"; }
    const char* helpSynopsis() const override { return "havc restore <revision> <path>"; }
    const char* helpDescription() const override { return "Overwrite <path> with its content at <revision>. The current content is kept in memory and written back if the restore fails. Works on network mounts that reject atomic replace."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<revision>", "Commit to take the file from."}, {"<path>", "File path relative to the configured root."} };
    }
};

}
