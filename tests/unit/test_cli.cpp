#include <gtest/gtest.h>
#include "mediaferry/core/cli.hpp"
#include "mediaferry/core/config.hpp"
#include <string>
#include <vector>

using namespace mediaferry::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "mediaferry");
        storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        return parser_.parse(static_cast<int>(argv_.size()), argv_.data());
    }

    CommandLineParser parser_{"mediaferry"};
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(CommandLineParserTest, PositionalArguments) {
    ASSERT_TRUE(parse({"fetch", "batch.txt", "/srv/media"}));
    const auto& args = parser_.get_positional_args();
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "fetch");
    EXPECT_EQ(args[2], "/srv/media");
}

TEST_F(CommandLineParserTest, LongOptionForms) {
    ASSERT_TRUE(parse({"--preset=aggressive", "--concurrency", "4", "fetch"}));
    EXPECT_EQ(parser_.get_option("preset"), "aggressive");
    EXPECT_EQ(parser_.get_option("concurrency"), "4");
    EXPECT_EQ(parser_.get_positional_args().size(), 1u);
}

TEST_F(CommandLineParserTest, ShortOptionForms) {
    ASSERT_TRUE(parse({"-vj3", "-p", "maximum"}));
    EXPECT_TRUE(parser_.has_option("verbose"));
    EXPECT_EQ(parser_.get_option("concurrency"), "3");
    EXPECT_EQ(parser_.get_option("preset"), "maximum");
}

TEST_F(CommandLineParserTest, DefaultValue) {
    ASSERT_TRUE(parse({}));
    EXPECT_FALSE(parser_.has_option("config"));
    EXPECT_EQ(parser_.get_option("config"), "~/.mediaferry.conf");
}

TEST_F(CommandLineParserTest, Errors) {
    EXPECT_FALSE(parse({"--bogus"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: --bogus");

    EXPECT_FALSE(parse({"--preset"}));
    EXPECT_EQ(parser_.get_error(), "Option --preset requires a value");

    EXPECT_FALSE(parse({"--digest=yes"}));
    EXPECT_FALSE(parse({"-x"}));
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(parse({"history", "--", "-5"}));
    ASSERT_EQ(parser_.get_positional_args().size(), 2u);
    EXPECT_EQ(parser_.get_positional_args()[1], "-5");
}

TEST_F(CommandLineParserTest, ApplyToConfig) {
    Config config;
    config.set_defaults();

    ASSERT_TRUE(parse({"--preset", "conservative", "--chunk-size=128", "--digest", "--no-history", "-v"}));
    EXPECT_EQ(parser_.apply_to(config), 5u);

    EXPECT_EQ(config.get_string("profile.preset"), "conservative");
    EXPECT_EQ(config.get_int("profile.chunk_size_kb"), 128);
    EXPECT_TRUE(config.get_bool("verify.digest"));
    EXPECT_FALSE(config.get_bool("history.enabled", true));
    EXPECT_EQ(config.get_string("log.level"), "debug");
    EXPECT_FALSE(config.has("profile.max_concurrent"));
}

TEST_F(CommandLineParserTest, LogLevelBeatsVerbose) {
    Config config;
    ASSERT_TRUE(parse({"--verbose", "--log-level", "warn"}));
    EXPECT_EQ(parser_.apply_to(config), 1u);
    EXPECT_EQ(config.get_string("log.level"), "warn");
}
