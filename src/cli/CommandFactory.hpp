#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace havc {

/**
 * @brief Name -> command registry
 *
 * registerBuiltins() installs every command shipped with havc; it is
 * idempotent so tests and main() can both call it.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    static void registerBuiltins();

    void registerCreator(const std::string& name, Creator creator);
    std::unique_ptr<ICommand> create(const std::string& name) const;
    bool contains(const std::string& name) const;

    /// One instance of every registered command, sorted by name
    std::vector<std::unique_ptr<ICommand>> listCommands() const;

private:
    CommandFactory() = default;
    std::unordered_map<std::string, Creator> creators;
};

}
