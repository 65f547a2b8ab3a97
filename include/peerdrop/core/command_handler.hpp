#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace peerdrop::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Runs a complete transfer between two in-process peers over the loopback
// negotiator, printing progress as it goes.
class SendCommandHandler : public CommandHandler {
public:
    explicit SendCommandHandler(std::chrono::seconds timeout = std::chrono::seconds(300));
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send a file between two local peers"; }
    std::string get_usage() const override { return "peerdrop send <file> [output]"; }
    
private:
    std::chrono::seconds timeout_;
};

class ChunksCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show how a file would be framed on the channel"; }
    std::string get_usage() const override { return "peerdrop chunks <file>"; }
};

class ConfigCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show the effective configuration or write it to a file"; }
    std::string get_usage() const override { return "peerdrop config [output]"; }
};

}
