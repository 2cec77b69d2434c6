#include <gtest/gtest.h>
#include "mediaferry/core/utils.hpp"
#include <cstdlib>
#include <filesystem>

using namespace mediaferry::core::utils;
using std::chrono::milliseconds;

TEST(StringUtilsTest, SplitWhitespace) {
    auto fields = StringUtils::split_whitespace("  2436\taudio   lofi  ");
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[0], "2436");
    EXPECT_EQ(fields[1], "audio");
    EXPECT_EQ(fields[2], "lofi");

    EXPECT_TRUE(StringUtils::split_whitespace(" \t ").empty());
}

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ(StringUtils::trim("\t balanced \n"), "balanced");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::to_lower("Video_Note"), "video_note");
}

TEST(StringUtilsTest, EndsWith) {
    EXPECT_TRUE(StringUtils::ends_with("track.mp3.part", ".part"));
    EXPECT_FALSE(StringUtils::ends_with("part", ".part"));
    EXPECT_TRUE(StringUtils::ends_with("downloads/", "/"));
}

TEST(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(0), "0 B");
    EXPECT_EQ(StringUtils::format_bytes(1023), "1023 B");
    EXPECT_EQ(StringUtils::format_bytes(1536), "1.50 KiB");
    EXPECT_EQ(StringUtils::format_bytes(512 * 1024), "512.00 KiB");
    EXPECT_EQ(StringUtils::format_bytes(3ULL * 1024 * 1024 * 1024), "3.00 GiB");
}

TEST(StringUtilsTest, FormatRate) {
    EXPECT_EQ(StringUtils::format_rate(2 * 1024 * 1024, milliseconds(2000)), "1.00 MiB/s");
    EXPECT_EQ(StringUtils::format_rate(1000, milliseconds(0)), "-");
}

TEST(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(4700)), "4.7s");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(125000)), "2m 05s");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(3723000)), "1h 02m 03s");
}

TEST(StringUtilsTest, ToHex) {
    const uint8_t bytes[] = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(StringUtils::to_hex(bytes, sizeof(bytes)), "000fa5ff");
    EXPECT_EQ(StringUtils::to_hex(bytes, 0), "");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "mediaferry_utils_test";
        std::filesystem::remove_all(root_);
    }

    void TearDown() override {
        std::filesystem::remove_all(root_);
    }

    std::filesystem::path root_;
};

TEST_F(FileUtilsTest, WriteAndSize) {
    auto nested = root_ / "channel" / "audio";
    ASSERT_TRUE(FileUtils::create_directories(nested));
    EXPECT_TRUE(FileUtils::is_directory(nested));

    auto file = nested / "1.mp3";
    ASSERT_TRUE(FileUtils::write_file(file, std::string(4096, 'a')));
    EXPECT_TRUE(FileUtils::exists(file));
    EXPECT_FALSE(FileUtils::is_directory(file));
    EXPECT_EQ(FileUtils::file_size(file).value_or(0), 4096u);

    // Rewriting truncates
    ASSERT_TRUE(FileUtils::write_file(file, "ab"));
    EXPECT_EQ(FileUtils::file_size(file).value_or(0), 2u);

    EXPECT_FALSE(FileUtils::file_size(root_ / "missing").has_value());
}

TEST_F(FileUtilsTest, CreateDirectoriesFailsOverFile) {
    ASSERT_TRUE(FileUtils::create_directories(root_));
    ASSERT_TRUE(FileUtils::write_file(root_ / "blocker", "x"));
    EXPECT_FALSE(FileUtils::create_directories(root_ / "blocker" / "sub"));
}

TEST_F(FileUtilsTest, ExpandHome) {
    const char* home = std::getenv("HOME");
    if (!home) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(FileUtils::expand_home("~/media/history.db"), std::filesystem::path(home) / "media/history.db");
    EXPECT_EQ(FileUtils::expand_home("~"), std::filesystem::path(home));
    EXPECT_EQ(FileUtils::expand_home("/srv/~/x"), std::filesystem::path("/srv/~/x"));
    EXPECT_EQ(FileUtils::expand_home("~user/x"), std::filesystem::path("~user/x"));
}

TEST(TimeUtilsTest, FormatTimestamp) {
    auto text = TimeUtils::format_timestamp(std::chrono::system_clock::now());
    ASSERT_EQ(text.size(), 19u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[13], ':');
}
