#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace relnotes {

/**
 * @brief Name -> command registry (singleton)
 *
 * Commands are created fresh per invocation; names are listed in
 * alphabetical order for help output.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();

    /// Register the built-in commands (help, generate)
    void registerDefaults();

    void registerCreator(const std::string& name, Creator creator);
    std::unique_ptr<ICommand> create(const std::string& name) const;
    bool has(const std::string& name) const { return creators.count(name) != 0; }

    /// One fresh instance per registered command, sorted by name
    std::vector<std::unique_ptr<ICommand>> listCommands() const;

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;
};

}
