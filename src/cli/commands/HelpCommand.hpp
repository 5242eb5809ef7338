#pragma once

#include "cli/ICommand.hpp"

namespace relnotes {

/// `relnotes help [command|environment]`
class HelpCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "List commands, usage and environment variables"; }
    const char* helpNameLine() const override { return "help -  Show help for commands"; }
    const char* helpSynopsis() const override { return "relnotes help [<command> | environment]"; }
    const char* helpDescription() const override {
        return "Without arguments, list the commands. With a command name, show its options.\n"
               "'relnotes help environment' lists the environment variables relnotes reads.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<command>", "Show detailed help for one command."},
            {"environment", "Show the environment variables used for defaults and logging."},
        };
    }

    /// (variable, meaning) pairs printed by `help environment`
    static std::vector<std::pair<std::string, std::string>> environmentVariables();
};

}
