#include "mediaferry/core/cli.hpp"
#include "mediaferry/core/config.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace mediaferry::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option({"help", 'h', "Show this help message"});
    add_option({"version", 'V', "Show version information"});
    add_option({"config", 'c', "Configuration file path", "", true, "", "~/.mediaferry.conf"});
    add_option({"preset", 'p', "Performance preset (conservative, balanced, aggressive, maximum)",
                "profile.preset", true});
    add_option({"concurrency", 'j', "Files fetched in parallel", "profile.max_concurrent", true});
    add_option({"chunk-size", '\0', "Chunk size in KiB", "profile.chunk_size_kb", true});
    add_option({"log-level", '\0', "trace, debug, info, warn, error", "log.level", true});
    add_option({"verbose", 'v', "Shorthand for --log-level debug", "log.level", false, "debug"});
    add_option({"digest", '\0', "Record a BLAKE2b digest of every completed file", "verify.digest"});
    add_option({"no-history", '\0', "Do not record outcomes in the history database",
                "history.enabled", false, "false"});
}

void CommandLineParser::add_option(OptionSpec spec) {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [&](const OptionSpec& o) { return o.long_name == spec.long_name; });
    if (it != options_.end()) {
        *it = std::move(spec);
    } else {
        options_.push_back(std::move(spec));
    }
}

void CommandLineParser::add_command(CommandSpec spec) {
    auto it = std::find_if(commands_.begin(), commands_.end(),
                           [&](const CommandSpec& c) { return c.name == spec.name; });
    if (it != commands_.end()) {
        *it = std::move(spec);
    } else {
        commands_.push_back(std::move(spec));
    }
}

const OptionSpec* CommandLineParser::find_long(const std::string& name) const {
    for (const auto& spec : options_) {
        if (spec.long_name == name) return &spec;
    }
    return nullptr;
}

const OptionSpec* CommandLineParser::find_short(char name) const {
    for (const auto& spec : options_) {
        if (spec.short_name != '\0' && spec.short_name == name) return &spec;
    }
    return nullptr;
}

bool CommandLineParser::take_value(const OptionSpec& spec, const std::string& inline_value, bool has_inline,
                                   int& index, int argc, char* argv[]) {
    if (!spec.takes_value) {
        if (has_inline) {
            error_ = "Option --" + spec.long_name + " takes no value";
            return false;
        }
        values_[spec.long_name] = spec.flag_value;
        return true;
    }

    if (has_inline) {
        values_[spec.long_name] = inline_value;
    } else if (index + 1 < argc) {
        values_[spec.long_name] = argv[++index];
    } else {
        error_ = "Option --" + spec.long_name + " requires a value";
        return false;
    }
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    values_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            positional_args_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            bool has_inline = eq_pos != std::string::npos;
            std::string name = arg.substr(2, has_inline ? eq_pos - 2 : std::string::npos);

            const auto* spec = find_long(name);
            if (!spec) {
                error_ = "Unknown option: --" + name;
                return false;
            }
            if (!take_value(*spec, has_inline ? arg.substr(eq_pos + 1) : "", has_inline, i, argc, argv)) {
                return false;
            }
            continue;
        }

        // Bundled short flags; a value-taking flag consumes the rest of the word
        for (size_t j = 1; j < arg.size(); ++j) {
            const auto* spec = find_short(arg[j]);
            if (!spec) {
                error_ = std::string("Unknown option: -") + arg[j];
                return false;
            }
            bool has_inline = spec->takes_value && j + 1 < arg.size();
            if (!take_value(*spec, has_inline ? arg.substr(j + 1) : "", has_inline, i, argc, argv)) {
                return false;
            }
            if (spec->takes_value) break;
        }
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& long_name) const {
    return values_.find(long_name) != values_.end();
}

std::string CommandLineParser::get_option(const std::string& long_name, const std::string& default_value) const {
    auto it = values_.find(long_name);
    if (it != values_.end()) {
        return it->second;
    }

    const auto* spec = find_long(long_name);
    if (spec && !spec->default_value.empty()) {
        return spec->default_value;
    }
    return default_value;
}

size_t CommandLineParser::apply_to(Config& config) const {
    size_t written = 0;
    for (const auto& spec : options_) {
        if (spec.config_key.empty() || !has_option(spec.long_name)) continue;
        // An explicit --log-level beats --verbose
        if (spec.long_name == "verbose" && has_option("log-level")) continue;
        config.set(spec.config_key, values_.at(spec.long_name));
        written++;
    }
    return written;
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& spec : options_) {
        std::string flags = spec.short_name != '\0' ? std::string("-") + spec.short_name + ", " : "    ";
        flags += "--" + spec.long_name + (spec.takes_value ? " <value>" : "");

        out << "  " << std::left << std::setw(28) << flags << spec.description;
        if (!spec.default_value.empty()) {
            out << " (default: " << spec.default_value << ")";
        }
        out << "\n";
    }

    if (commands_.empty()) return;

    out << "\nCommands:\n";
    for (const auto& command : commands_) {
        out << "  " << std::left << std::setw(28) << command.name << command.description << "\n";
        out << "  " << std::setw(28) << "" << "Usage: " << command.usage << "\n";
    }
    out << "\nRun '" << program_name_ << " help <command>' for one command.\n";
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.0.0\n";
}

}
