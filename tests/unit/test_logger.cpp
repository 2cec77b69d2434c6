#include <gtest/gtest.h>
#include "mediaferry/core/logger.hpp"
#include <filesystem>
#include <fstream>
#include <atomic>
#include <iterator>
#include <thread>
#include <vector>

using namespace mediaferry::core;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove(log_file_);
    }

    std::string read_log() {
        Logger::get()->flush();
        std::ifstream file(log_file_);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    std::filesystem::path log_file_ = std::filesystem::temp_directory_path() / "mediaferry_logger_test.log";
};

TEST_F(LoggerTest, WritesFileWithSourceLocation) {
    Logger::initialize(log_file_.string(), LogLevel::Debug);
    EXPECT_TRUE(std::filesystem::exists(log_file_));

    LOG_DEBUG("Chunk {} of item {} retried", 3, 2436);
    LOG_WARN("Session {} cooling down for {}ms", "local", 1500);

    auto content = read_log();
    EXPECT_NE(content.find("Chunk 3 of item 2436 retried"), std::string::npos);
    EXPECT_NE(content.find("Session local cooling down for 1500ms"), std::string::npos);
    EXPECT_NE(content.find("test_logger.cpp"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersFileOutput) {
    Logger::initialize(log_file_.string(), LogLevel::Warn);

    LOG_DEBUG("debug detail");
    LOG_INFO("info detail");
    LOG_ERROR("item failed");

    auto content = read_log();
    EXPECT_EQ(content.find("debug detail"), std::string::npos);
    EXPECT_EQ(content.find("info detail"), std::string::npos);
    EXPECT_NE(content.find("item failed"), std::string::npos);
}

TEST_F(LoggerTest, EmptyPathLogsToConsoleOnly) {
    Logger::initialize("", LogLevel::Info);
    ASSERT_NE(Logger::get(), nullptr);
    EXPECT_EQ(Logger::get()->sinks().size(), 1u);
    LOG_INFO("console only");
}

TEST_F(LoggerTest, ReinitializeReplacesLogger) {
    Logger::initialize("", LogLevel::Info);
    Logger::initialize(log_file_.string(), LogLevel::Info);
    EXPECT_EQ(Logger::get()->sinks().size(), 2u);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level(" WARNING "), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parse_level("loud"), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("loud", LogLevel::Error), LogLevel::Error);
}

TEST_F(LoggerTest, UsableAfterShutdown) {
    Logger::initialize(log_file_.string(), LogLevel::Info);
    Logger::shutdown();

    ASSERT_NE(Logger::get(), nullptr);
    LOG_INFO("still logging after shutdown");
}

TEST_F(LoggerTest, WorkersLogWhileLoggerIsReplaced) {
    std::atomic<bool> stop{false};
    std::atomic<size_t> logged{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&stop, &logged, i] {
            while (!stop) {
                LOG_DEBUG("worker {} chunk {}", i, logged.load());
                ASSERT_NE(Logger::get(), nullptr);
                logged++;
            }
        });
    }

    while (logged.load() < 4) {
        std::this_thread::yield();
    }
    for (int round = 0; round < 50; ++round) {
        Logger::initialize("", LogLevel::Off);
        Logger::shutdown();
    }
    stop = true;
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_GE(logged.load(), 4u);
}
