#pragma once

#include "command_handler.hpp"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace peerdrop::core {

class CommandRegistry {
public:
    CommandRegistry();
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    
    bool has_command(const std::string& command) const;
    
    // (usage, description) pairs in command-name order.
    std::vector<std::pair<std::string, std::string>> describe_commands() const;
    
private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
