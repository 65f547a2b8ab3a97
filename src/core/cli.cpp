#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/command_registry.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/transfer/chunk_codec.hpp"
#include "peerdrop/version.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace peerdrop::core {

namespace {
    constexpr char NO_SHORT_NAME = '\0';
}

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name)
    , options_{
        {'h', "help", "Show this help message", ValueKind::None, ""},
        {'v', "version", "Show version information", ValueKind::None, ""},
        {'c', "config", "Configuration file", ValueKind::Path, "peerdrop.conf"},
        {NO_SHORT_NAME, "verbose", "Log at debug level", ValueKind::None, ""},
        {'s', "chunk-size", "Bytes per data channel message, at most " +
            std::to_string(transfer::MAX_CHUNK_SIZE), ValueKind::ChunkSize, ""},
    }
{
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_.clear();
    error_.clear();
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (!positional_args_.empty() || arg.size() < 2 || arg[0] != '-') {
            positional_args_.push_back(arg);
            continue;
        }
        
        const Option* option = nullptr;
        std::string spelled;
        std::optional<std::string> value;
        
        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            spelled = arg.substr(0, eq_pos);
            option = find_long(spelled.substr(2));
            if (eq_pos != std::string::npos) {
                value = arg.substr(eq_pos + 1);
            }
        } else {
            // -s8192 and -s 8192 are both accepted
            spelled = arg.substr(0, 2);
            option = find_short(arg[1]);
            if (arg.size() > 2) {
                value = arg.substr(2);
            }
        }
        
        if (!option) {
            error_ = "Unknown option: " + spelled;
            return false;
        }
        
        if (option->kind == ValueKind::None) {
            if (value) {
                error_ = "Option " + spelled + " does not take a value";
                return false;
            }
            parsed_[option->long_name] = "true";
            continue;
        }
        
        if (!value) {
            if (i + 1 >= argc) {
                error_ = "Option " + spelled + " requires a value";
                return false;
            }
            value = argv[++i];
        }
        
        if (!store(*option, *value)) {
            return false;
        }
    }
    
    return true;
}

bool CommandLineParser::store(const Option& option, const std::string& value) {
    if (option.kind != ValueKind::ChunkSize) {
        parsed_[option.long_name] = value;
        return true;
    }
    
    std::uint64_t size = 0;
    bool valid = !value.empty() && value.find('-') == std::string::npos;
    if (valid) {
        try {
            std::size_t consumed = 0;
            size = std::stoull(value, &consumed);
            valid = consumed == value.size();
        } catch (const std::exception&) {
            valid = false;
        }
    }
    
    if (!valid || size == 0 || size > transfer::MAX_CHUNK_SIZE) {
        error_ = "--" + option.long_name + " must be between 1 and " +
                 std::to_string(transfer::MAX_CHUNK_SIZE) + ", got '" + value + "'";
        return false;
    }
    
    parsed_[option.long_name] = std::to_string(size);
    return true;
}

bool CommandLineParser::has_option(const std::string& long_name) const {
    return parsed_.find(long_name) != parsed_.end();
}

std::string CommandLineParser::get_option(const std::string& long_name) const {
    auto it = parsed_.find(long_name);
    if (it != parsed_.end()) {
        return it->second;
    }
    
    auto option = find_long(long_name);
    return option ? option->default_value : "";
}

std::optional<std::uint64_t> CommandLineParser::get_chunk_size() const {
    auto it = parsed_.find("chunk-size");
    if (it == parsed_.end()) {
        return std::nullopt;
    }
    return std::stoull(it->second);
}

void CommandLineParser::apply_to(Config& config) const {
    if (auto chunk_size = get_chunk_size()) {
        config.set("transfer.chunk_size", std::to_string(*chunk_size));
    }
}

const CommandLineParser::Option* CommandLineParser::find_long(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.long_name == name) {
            return &option;
        }
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::find_short(char name) const {
    for (const auto& option : options_) {
        if (option.short_name != NO_SHORT_NAME && option.short_name == name) {
            return &option;
        }
    }
    return nullptr;
}

void CommandLineParser::print_help(const CommandRegistry& commands) const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";
    
    for (const auto& option : options_) {
        std::string flags = option.short_name != NO_SHORT_NAME ?
            std::string("-") + option.short_name + ", " : "    ";
        flags += "--" + option.long_name;
        if (option.kind == ValueKind::Path) {
            flags += " <path>";
        } else if (option.kind == ValueKind::ChunkSize) {
            flags += " <bytes>";
        }
        
        std::cout << "  " << std::left << std::setw(28) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
    
    std::cout << "\nCommands:\n";
    for (const auto& [usage, description] : commands.describe_commands()) {
        std::cout << "  " << std::left << std::setw(32) << usage << description << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version " << PEERDROP_VERSION << "\n";
    std::cout << "Default chunk size " << transfer::DEFAULT_CHUNK_SIZE << " bytes\n";
}

}
