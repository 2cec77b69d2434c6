#include <gtest/gtest.h>
#include "mediaferry/core/cli.hpp"
#include "mediaferry/core/command_registry.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace mediaferry::core;

namespace {

class RecordingHandler : public CommandHandler {
public:
    explicit RecordingHandler(std::vector<std::string>& calls) : calls_(calls) {}

    CommandResult execute(const std::vector<std::string>& args) override {
        calls_ = args;
        return CommandResult::ok();
    }
    std::string get_description() const override { return "Check a manifest without fetching"; }
    std::string get_usage() const override { return "mediaferry verify <manifest>"; }

private:
    std::vector<std::string>& calls_;
};

}

class CommandRegistryTest : public ::testing::Test {
protected:
    CommandRegistry registry_;
    std::vector<std::string> calls_;
};

TEST_F(CommandRegistryTest, RunsRegisteredHandler) {
    registry_.register_command("verify", std::make_unique<RecordingHandler>(calls_));

    auto result = registry_.execute_command("verify", {"verify", "items.manifest"});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(calls_, (std::vector<std::string>{"verify", "items.manifest"}));
}

TEST_F(CommandRegistryTest, UnknownCommandIsUsageError) {
    auto result = registry_.execute_command("download", {"download"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, CommandResult::USAGE_EXIT_CODE);
    EXPECT_NE(result.message.find("fetch, history, plan, presets"), std::string::npos);
    EXPECT_FALSE(registry_.has_command("download"));
}

TEST_F(CommandRegistryTest, MissingArgumentsAreUsageErrors) {
    auto fetch = registry_.execute_command("fetch", {"fetch"});
    EXPECT_EQ(fetch.exit_code, CommandResult::USAGE_EXIT_CODE);
    EXPECT_NE(fetch.message.find("mediaferry fetch <manifest> <source_root>"), std::string::npos);

    auto history = registry_.execute_command("history", {"history", "ten"});
    EXPECT_EQ(history.exit_code, CommandResult::USAGE_EXIT_CODE);
}

TEST_F(CommandRegistryTest, HelpForOneCommandDoesNotRunIt) {
    registry_.register_command("verify", std::make_unique<RecordingHandler>(calls_));

    auto result = registry_.execute_command("help", {"help", "verify"});
    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("Usage: mediaferry verify <manifest>"), std::string::npos);
    EXPECT_TRUE(calls_.empty());

    auto unknown = registry_.execute_command("help", {"help", "download"});
    EXPECT_EQ(unknown.exit_code, CommandResult::USAGE_EXIT_CODE);

    auto bare = registry_.execute_command("help", {"help"});
    EXPECT_FALSE(bare.success);
    EXPECT_TRUE(registry_.has_command("help"));
}

TEST_F(CommandRegistryTest, HelpNameCannotBeReplaced) {
    registry_.register_command("help", std::make_unique<RecordingHandler>(calls_));

    auto result = registry_.execute_command("help", {"help", "fetch"});
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(calls_.empty());
}

TEST_F(CommandRegistryTest, ParserHelpListsCommandsAfterOptions) {
    registry_.register_command("verify", std::make_unique<RecordingHandler>(calls_));
    CommandLineParser parser("mediaferry");
    registry_.describe_to(parser);

    std::ostringstream out;
    parser.print_help(out);
    auto text = out.str();

    auto options = text.find("Options:");
    auto commands = text.find("Commands:");
    ASSERT_NE(options, std::string::npos);
    ASSERT_NE(commands, std::string::npos);
    EXPECT_LT(options, commands);
    EXPECT_NE(text.find("--preset <value>"), std::string::npos);
    EXPECT_NE(text.find("Download every item listed in a manifest"), std::string::npos);
    EXPECT_NE(text.find("Usage: mediaferry verify <manifest>"), std::string::npos);
    EXPECT_NE(text.find("mediaferry help <command>"), std::string::npos);
}

TEST_F(CommandRegistryTest, ParserWithoutCommandsPrintsOptionsOnly) {
    CommandLineParser parser("mediaferry");
    std::ostringstream out;
    parser.print_help(out);
    EXPECT_EQ(out.str().find("Commands:"), std::string::npos);
}
