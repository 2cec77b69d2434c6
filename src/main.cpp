#include <iostream>
#include <string>
#include <vector>
#include "mediaferry/core/logger.hpp"
#include "mediaferry/core/config.hpp"
#include "mediaferry/core/cli.hpp"
#include "mediaferry/core/utils.hpp"
#include "mediaferry/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    mediaferry::core::CommandLineParser parser("mediaferry");
    mediaferry::core::CommandRegistry command_registry;
    command_registry.describe_to(parser);
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help(std::cerr);
        return mediaferry::core::CommandResult::USAGE_EXIT_CODE;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = mediaferry::core::Config::instance();
    config.set_defaults();
    
    auto config_file = mediaferry::core::utils::FileUtils::expand_home(parser.get_option("config"));
    if (mediaferry::core::utils::FileUtils::exists(config_file) &&
        !config.load_from_file(config_file.string())) {
        std::cerr << "Error: cannot read " << config_file.string() << "\n";
        return 1;
    }
    
    parser.apply_to(config);

    mediaferry::core::Logger::initialize(config.get_string("log.file", "mediaferry.log"),
        mediaferry::core::Logger::parse_level(config.get_string("log.level", "info")));
    
    LOG_INFO("mediaferry starting up");
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        mediaferry::core::Logger::shutdown();
        return 0;
    }
    
    std::string command = args[0];
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cerr << "\n";
            parser.print_help(std::cerr);
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    mediaferry::core::Logger::shutdown();
    return result.exit_code;
}
