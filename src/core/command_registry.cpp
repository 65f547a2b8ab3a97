#include "peerdrop/core/command_registry.hpp"

namespace peerdrop::core {

CommandRegistry::CommandRegistry() {
    register_command("send", std::make_unique<SendCommandHandler>());
    register_command("chunks", std::make_unique<ChunksCommandHandler>());
    register_command("config", std::make_unique<ConfigCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

std::vector<std::pair<std::string, std::string>> CommandRegistry::describe_commands() const {
    std::vector<std::pair<std::string, std::string>> commands;
    commands.reserve(handlers_.size());
    
    for (const auto& [name, handler] : handlers_) {
        commands.emplace_back(handler->get_usage(), handler->get_description());
    }
    return commands;
}

}
