// relnotes entry point: Command Pattern dispatch over the release-note pipeline.

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"

using namespace relnotes;

int main(int argc, char** argv) {
    auto& factory = CommandFactory::instance();
    factory.registerDefaults();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx{};
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = factory.create("help");
        return CommandInvoker::exitCode(invoker.invoke(*cmd, ctx, {}));
    }

    std::string cmdName = args.front();
    // Bare options go to the default command
    if (cmdName.rfind("--", 0) == 0) {
        cmdName = "generate";
    } else {
        args.erase(args.begin());
    }

    auto cmd = factory.create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        std::cerr << "See 'relnotes help' for the list of commands.\n";
        return 1;
    }
    return CommandInvoker::exitCode(invoker.invoke(*cmd, ctx, args));
}
