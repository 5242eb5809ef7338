#include "cli/CommandFactory.hpp"

#include "cli/commands/GenerateCommand.hpp"
#include "cli/commands/HelpCommand.hpp"

namespace relnotes {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerDefaults() {
    registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    registerCreator("generate", [] { return std::make_unique<GenerateCommand>(); });
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

std::vector<std::unique_ptr<ICommand>> CommandFactory::listCommands() const {
    std::vector<std::unique_ptr<ICommand>> out;
    out.reserve(creators.size());
    // std::map iterates in name order
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    return out;
}

}
