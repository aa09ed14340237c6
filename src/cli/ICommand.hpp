#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/Config.hpp"
#include "core/FileStore.hpp"
#include "core/GitClient.hpp"
#include "core/ProcessRunner.hpp"
#include "util/Expected.hpp"

namespace havc {

/**
 * @brief Services handed to every command
 *
 * main() fills this with the real runner and filesystem; tests swap in
 * fakes. Commands never look at the process working directory.
 */
struct AppContext {
    Config config;
    std::shared_ptr<IProcessRunner> runner;
    std::shared_ptr<IFileStore> files;

    GitClient git() const { return GitClient(config, runner); }
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

}
