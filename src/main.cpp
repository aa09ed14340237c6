// havc: version history and safe restore for a git-managed configuration directory.

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "core/Config.hpp"
#include "core/FileStore.hpp"
#include "core/ProcessRunner.hpp"
#include "util/Logger.hpp"

using namespace havc;

int main(int argc, char** argv) {
    CommandFactory::registerBuiltins();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    auto cfg = Config::fromEnvironment();
    if (!cfg) {
        Logger::instance().error(cfg.error().message);
        return 1;
    }
    AppContext ctx{};
    ctx.config = cfg.value();
    auto rest = ctx.config.applyArgs(args);
    if (!rest) {
        Logger::instance().error(rest.error().message);
        return 1;
    }
    args = rest.value();
    if (ctx.config.verbose) Logger::instance().setLevel(LogLevel::Debug);
    ctx.runner = std::make_shared<PosixProcessRunner>();
    ctx.files = std::make_shared<LocalFileStore>();

    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        invoker.invoke(*cmd, ctx, {});
        return 0;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return CommandInvoker::exitStatus(res);
}
