#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace havc {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "Name:\n" << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << opt << " :  " << desc << "\n\n";
        }
    }
}

void printGlobalFlags() {
    std::cout << "\nGlobal flags (before the command):\n"
              << "  --root <dir>        Repository root (default $HAVC_ROOT or the current directory)\n"
              << "  --git <bin>         git executable (default $HAVC_GIT or git)\n"
              << "  --timeout-ms <n>    Per-command timeout (default 30000)\n"
              << "  --max-output <n>    Output cap per stream in bytes (default 10485760)\n"
              << "  -v, --verbose       Debug logging\n";
}

}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::string topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (cmd) {
            printCommandDetail(*cmd);
            return {};
        }
        std::cerr << "Unknown help topic: " << topic << "\n\n";
    }

    std::cout << "usage: havc [global flags] <command> [<args>]\n\n";
    std::cout << "These are the havc commands:\n\n";
    for (const auto& c : CommandFactory::instance().listCommands()) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
    }
    printGlobalFlags();
    return {};
}

}
