#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediaferry::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split_whitespace(const std::string& str);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool ends_with(const std::string& str, const std::string& suffix);

    // 1536 -> "1.50 KiB"
    static std::string format_bytes(uint64_t bytes);
    static std::string format_rate(uint64_t bytes, std::chrono::milliseconds elapsed);
    static std::string format_duration(std::chrono::milliseconds duration);
    static std::string to_hex(const uint8_t* data, size_t size);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_directory(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static bool write_file(const std::filesystem::path& path, const std::string& content);
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

}
