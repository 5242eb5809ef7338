#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace relnotes {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "NAME:\n" << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << "  " << opt << "\n      " << desc << "\n";
        }
        std::cout << "\n";
    }
}

}

std::vector<std::pair<std::string, std::string>> HelpCommand::environmentVariables() {
    return {
        {"GITHUB_REPOSITORY", "\"owner/name\" used when --owner/--repo are not given."},
        {"GITHUB_OUTPUT", "File that --github-output appends the notes to."},
        {"GITHUB_ACTIONS", "When \"true\", warnings and errors are logged as workflow commands."},
        {"RELNOTES_LOG", "Log level: error, warn, info (default) or debug."},
    };
}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        const std::string& topic = args.front();
        if (topic == "environment") {
            std::cout << "ENVIRONMENT:\n";
            for (const auto& [var, desc] : environmentVariables()) {
                std::cout << "  " << var << "\n      " << desc << "\n";
            }
            return {};
        }
        auto cmd = CommandFactory::instance().create(topic);
        if (!cmd) {
            return Error{ErrorCode::InvalidArgs, "Unknown help topic: " + topic};
        }
        printCommandDetail(*cmd);
        return {};
    }

    std::cout << "usage: relnotes <command> [options]\n\n";
    std::cout << "Generate categorized release notes from git commit history.\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : CommandFactory::instance().listCommands()) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
    }
    std::cout << "\nSee 'relnotes help <command>' for details.\n";
    return {};
}

}
