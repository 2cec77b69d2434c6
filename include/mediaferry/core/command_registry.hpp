#pragma once

#include "command_handler.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mediaferry::core {

class CommandLineParser;

class CommandRegistry {
public:
    // Registers fetch, plan, presets and history
    CommandRegistry();
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    
    // "help <command>" answers with that command's usage instead of running it
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    
    // Adds every registered command to the parser's help text
    void describe_to(CommandLineParser& parser) const;
    
private:
    CommandResult help_for(const std::vector<std::string>& args) const;
    std::string command_names() const;
    
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
