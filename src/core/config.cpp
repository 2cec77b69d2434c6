#include "mediaferry/core/config.hpp"
#include "mediaferry/core/logger.hpp"
#include "mediaferry/core/utils.hpp"
#include <algorithm>
#include <array>
#include <string_view>

namespace mediaferry::core {

namespace {

constexpr std::array<std::string_view, 16> known_keys = {
    "profile.preset", "profile.max_concurrent", "profile.chunk_size_kb",
    "profile.buffer_size_kb", "profile.inter_file_delay_ms", "profile.flood_wait_multiplier",
    "profile.max_chunk_retries", "profile.retry_base_delay_ms", "profile.max_rate_limit_retries",
    "profile.progress_interval_ms", "session.max_concurrency", "history.enabled",
    "history.database", "verify.digest", "log.level", "log.file",
};

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::is_known_key(const std::string& key) {
    return std::find(known_keys.begin(), known_keys.end(), key) != known_keys.end();
}

// Accepts flat "a.b = v" lines and "[a]" headers that prefix the keys below them
bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string section;
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line = utils::StringUtils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                LOG_WARN("{}:{}: unterminated section header", filename, line_number);
                continue;
            }
            section = utils::StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            LOG_WARN("{}:{}: expected key=value", filename, line_number);
            continue;
        }

        std::string key = utils::StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: empty key", filename, line_number);
            continue;
        }
        if (!section.empty()) {
            key = section + "." + key;
        }
        if (!is_known_key(key)) {
            LOG_WARN("{}:{}: unknown setting '{}'", filename, line_number, key);
        }
        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# mediaferry configuration\n";

    for (const auto& [key, value] : values_) {
        if (key.find('.') == std::string::npos) {
            file << key << " = " << value << "\n";
        }
    }

    // Keys are sorted, so each prefix forms one contiguous section
    std::string section;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        if (dot == std::string::npos) continue;

        auto prefix = key.substr(0, dot);
        if (prefix != section) {
            section = prefix;
            file << "\n[" << section << "]\n";
        }
        file << key.substr(dot + 1) << " = " << value << "\n";
    }

    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = utils::StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

double Config::get_double(const std::string& key, double default_value) const {
    return get_as<double>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    values_["profile.preset"] = "balanced";
    values_["session.max_concurrency"] = "8";
    values_["history.enabled"] = "true";
    values_["history.database"] = "mediaferry_history.db";
    values_["verify.digest"] = "false";
    values_["log.level"] = "info";
    values_["log.file"] = "mediaferry.log";
}

}
