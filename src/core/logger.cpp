#include "mediaferry/core/logger.hpp"
#include "mediaferry/core/utils.hpp"
#include <array>
#include <utility>
#include <vector>

namespace mediaferry::core {

namespace {

constexpr size_t max_log_file_bytes = 5 * 1024 * 1024;
constexpr size_t max_log_files = 3;

constexpr std::array<std::pair<const char*, LogLevel>, 8> level_names = {{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"off", LogLevel::Off},
}};

}

std::mutex Logger::mutex_;
std::shared_ptr<spdlog::logger> Logger::logger_;

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logger_) {
            return logger_;
        }
    }
    return spdlog::default_logger();
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto spd_level = static_cast<spdlog::level::level_enum>(level);

    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spd_level);
    console_sink->set_pattern("%H:%M:%S.%e %^%-5l%$ %v");
    sinks.push_back(console_sink);

    // An empty path keeps logging on the console only
    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, max_log_file_bytes, max_log_files);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] [%s:%#] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("mediaferry", sinks.begin(), sinks.end());
    logger->set_level(spd_level);
    logger->flush_on(spdlog::level::warn);
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logger_) {
            spdlog::drop(logger_->name());
        }
        logger_ = logger;
        spdlog::set_default_logger(logger);
    }

    LOG_DEBUG("Logging at {} to {}", spdlog::level::to_string_view(spd_level),
              log_file.empty() ? "console" : log_file);
}

void Logger::shutdown() {
    std::shared_ptr<spdlog::logger> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(logger_);
        if (!previous) {
            return;
        }
        spdlog::drop(previous->name());
        // Worker threads may still log after shutdown; give them a console-only default
        spdlog::set_default_logger(std::make_shared<spdlog::logger>(
            "", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
    }
    // Threads that fetched the old logger keep it alive until they are done with it
    previous->flush();
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    for (const auto& [text, level] : level_names) {
        if (lower == text) {
            return level;
        }
    }
    return fallback;
}

}
