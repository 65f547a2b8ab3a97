#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop::core {

class Config;
class CommandRegistry;

// Global options, which come before the command word. Anything from the
// command word on is passed to the command untouched. --chunk-size is
// range-checked while parsing.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);
    
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& long_name) const;
    std::string get_option(const std::string& long_name) const;
    std::optional<std::uint64_t> get_chunk_size() const;
    
    // Command-line values override the matching configuration keys.
    void apply_to(Config& config) const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help(const CommandRegistry& commands) const;
    void print_version() const;
    
private:
    enum class ValueKind {
        None,
        Path,
        ChunkSize
    };
    
    struct Option {
        char short_name;
        std::string long_name;
        std::string description;
        ValueKind kind;
        std::string default_value;
    };
    
    const Option* find_long(const std::string& name) const;
    const Option* find_short(char name) const;
    bool store(const Option& option, const std::string& value);
    
    std::string program_name_;
    std::vector<Option> options_;
    std::map<std::string, std::string> parsed_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
