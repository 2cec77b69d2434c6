#pragma once

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace mediaferry::core {

class Config;

struct OptionSpec {
    std::string long_name;
    char short_name = '\0';
    std::string description;
    // Configuration key the option overrides; empty for options main() handles itself
    std::string config_key;
    bool takes_value = false;
    // Value stored for a flag that takes none
    std::string flag_value = "true";
    std::string default_value;
};

// Listed under "Commands:" in the help text
struct CommandSpec {
    std::string name;
    std::string description;
    std::string usage;
};

class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(OptionSpec spec);
    void add_command(CommandSpec spec);

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& long_name) const;
    std::string get_option(const std::string& long_name, const std::string& default_value = "") const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    // Writes every given option that carries a config key; returns how many were written
    size_t apply_to(Config& config) const;

    void print_help(std::ostream& out = std::cout) const;
    void print_version() const;

private:
    const OptionSpec* find_long(const std::string& name) const;
    const OptionSpec* find_short(char name) const;
    bool take_value(const OptionSpec& spec, const std::string& inline_value, bool has_inline,
                    int& index, int argc, char* argv[]);

    std::string program_name_;
    std::vector<OptionSpec> options_;
    std::vector<CommandSpec> commands_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
