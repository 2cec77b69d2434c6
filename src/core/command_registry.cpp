#include "mediaferry/core/command_registry.hpp"
#include "mediaferry/core/cli.hpp"
#include "mediaferry/core/logger.hpp"

namespace mediaferry::core {

CommandRegistry::CommandRegistry() {
    register_command("fetch", std::make_unique<FetchCommandHandler>());
    register_command("plan", std::make_unique<PlanCommandHandler>());
    register_command("presets", std::make_unique<PresetsCommandHandler>());
    register_command("history", std::make_unique<HistoryCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    if (name == "help") {
        LOG_WARN("Command name 'help' is reserved; handler ignored");
        return;
    }
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    if (command == "help") {
        return help_for(args);
    }
    
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::usage("Unknown command: " + command + " (available: " + command_names() + ")");
    }
    
    LOG_DEBUG("Running command {} with {} arguments", command, args.size() > 0 ? args.size() - 1 : 0);
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return command == "help" || handlers_.find(command) != handlers_.end();
}

void CommandRegistry::describe_to(CommandLineParser& parser) const {
    for (const auto& [name, handler] : handlers_) {
        parser.add_command({name, handler->get_description(), handler->get_usage()});
    }
    parser.add_command({"help", "Show usage for one command", "mediaferry help <command>"});
}

CommandResult CommandRegistry::help_for(const std::vector<std::string>& args) const {
    if (args.size() < 2) {
        return CommandResult::usage("Usage: mediaferry help <command> (commands: " + command_names() + ")");
    }
    
    auto it = handlers_.find(args[1]);
    if (it == handlers_.end()) {
        return CommandResult::usage("Unknown command: " + args[1] + " (available: " + command_names() + ")");
    }
    return CommandResult::ok(it->second->get_description() + "\nUsage: " + it->second->get_usage());
}

std::string CommandRegistry::command_names() const {
    std::string names;
    for (const auto& [name, handler] : handlers_) {
        if (!names.empty()) names += ", ";
        names += name;
    }
    return names;
}

}
