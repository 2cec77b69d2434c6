#pragma once

#include <string>
#include <vector>

namespace mediaferry::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
    
    // Wrong arguments or an unknown command
    static CommandResult usage(const std::string& msg) {
        return CommandResult{false, msg, USAGE_EXIT_CODE};
    }
    
    static constexpr int USAGE_EXIT_CODE = 64;
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name itself
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Runs one batch from a manifest against a local source tree
class FetchCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download every item listed in a manifest"; }
    std::string get_usage() const override { return "mediaferry fetch <manifest> <source_root>"; }
};

// Dry run of the resume/dedup gate
class PlanCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show what fetch would skip, resume or start"; }
    std::string get_usage() const override { return "mediaferry plan <manifest>"; }
};

class PresetsCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List performance presets"; }
    std::string get_usage() const override { return "mediaferry presets"; }
};

class HistoryCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show recorded transfer outcomes"; }
    std::string get_usage() const override { return "mediaferry history [limit]"; }
};

}
