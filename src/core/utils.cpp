#include "mediaferry/core/utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace mediaferry::core::utils {

namespace {

bool is_space(unsigned char c) {
    return std::isspace(c) != 0;
}

}

std::vector<std::string> StringUtils::split_whitespace(const std::string& str) {
    std::vector<std::string> fields;
    std::istringstream iss(str);
    std::string field;
    while (iss >> field) {
        fields.push_back(std::move(field));
    }
    return fields;
}

std::string StringUtils::trim(const std::string& str) {
    auto first = std::find_if_not(str.begin(), str.end(), is_space);
    auto last = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower(str.size(), '\0');
    std::transform(str.begin(), str.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool StringUtils::ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StringUtils::format_bytes(uint64_t bytes) {
    static constexpr std::array<const char*, 5> units = {"B", "KiB", "MiB", "GiB", "TiB"};

    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }

    size_t unit = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024.0 && unit + 1 < units.size()) {
        size /= 1024.0;
        unit++;
    }
    return fmt::format("{:.2f} {}", size, units[unit]);
}

std::string StringUtils::format_rate(uint64_t bytes, std::chrono::milliseconds elapsed) {
    if (elapsed.count() <= 0) {
        return "-";
    }
    auto per_second = static_cast<uint64_t>(static_cast<double>(bytes) * 1000.0 / elapsed.count());
    return format_bytes(per_second) + "/s";
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }

    auto total_seconds = ms / 1000;
    auto hours = total_seconds / 3600;
    auto minutes = (total_seconds / 60) % 60;
    auto seconds = total_seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h {:02}m {:02}s", hours, minutes, seconds);
    }
    if (minutes > 0) {
        return fmt::format("{}m {:02}s", minutes, seconds);
    }
    return fmt::format("{}.{}s", seconds, (ms % 1000) / 100);
}

std::string StringUtils::to_hex(const uint8_t* data, size_t size) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::is_directory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

std::optional<uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

bool FileUtils::write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file.good();
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (path != "~" && path.rfind("~/", 0) != 0) {
        return std::filesystem::path(path);
    }
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::path(".");
    return path.size() > 2 ? base / path.substr(2) : base;
}

std::string TimeUtils::format_timestamp(const std::chrono::system_clock::time_point& time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::array<char, 32> buffer{};
    auto written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buffer.data(), written);
}

}
