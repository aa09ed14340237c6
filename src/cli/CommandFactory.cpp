#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/AddCommand.hpp"
#include "cli/commands/BranchCommand.hpp"
#include "cli/commands/CommitCommand.hpp"
#include "cli/commands/DiffCommand.hpp"
#include "cli/commands/GraphCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InitCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/RestoreCommand.hpp"
#include "cli/commands/ShowCommand.hpp"
#include "cli/commands/StatusCommand.hpp"

namespace havc {

namespace {

template <typename Command>
void add(CommandFactory& f) {
    Command sample;
    f.registerCreator(sample.name(), [] { return std::make_unique<Command>(); });
}

}

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerBuiltins() {
    auto& f = instance();
    add<HelpCommand>(f);
    add<InitCommand>(f);
    add<AddCommand>(f);
    add<CommitCommand>(f);
    add<StatusCommand>(f);
    add<LogCommand>(f);
    add<GraphCommand>(f);
    add<DiffCommand>(f);
    add<ShowCommand>(f);
    add<RestoreCommand>(f);
    add<BranchCommand>(f);
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

bool CommandFactory::contains(const std::string& name) const {
    return creators.find(name) != creators.end();
}

std::vector<std::unique_ptr<ICommand>> CommandFactory::listCommands() const {
    std::vector<std::unique_ptr<ICommand>> out;
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
    return out;
}

}
