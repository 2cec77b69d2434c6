#include "mediaferry/transfer/performance_profile.hpp"
#include "mediaferry/core/config.hpp"
#include "mediaferry/core/utils.hpp"
#include <sstream>

namespace mediaferry::transfer {

namespace {

constexpr uint64_t KIB = 1024;

PerformanceProfile make_preset(ProfilePreset preset,
                               uint32_t max_concurrent,
                               uint64_t chunk_kib,
                               int64_t inter_file_delay_ms,
                               double flood_wait_multiplier) {
    PerformanceProfile profile;
    profile.preset = preset;
    profile.max_concurrent = max_concurrent;
    profile.chunk_size_bytes = chunk_kib * KIB;
    profile.buffer_size_bytes = 1024 * KIB;
    profile.inter_file_delay = std::chrono::milliseconds(inter_file_delay_ms);
    profile.flood_wait_multiplier = flood_wait_multiplier;
    return profile;
}

}

const char* to_string(ProfilePreset preset) {
    switch (preset) {
        case ProfilePreset::CONSERVATIVE: return "conservative";
        case ProfilePreset::BALANCED: return "balanced";
        case ProfilePreset::AGGRESSIVE: return "aggressive";
        case ProfilePreset::MAXIMUM: return "maximum";
        case ProfilePreset::CUSTOM: return "custom";
    }
    return "custom";
}

PerformanceProfile PerformanceProfile::conservative() {
    return make_preset(ProfilePreset::CONSERVATIVE, 1, 256, 1000, 2.0);
}

PerformanceProfile PerformanceProfile::balanced() {
    return make_preset(ProfilePreset::BALANCED, 3, 512, 300, 1.5);
}

PerformanceProfile PerformanceProfile::aggressive() {
    return make_preset(ProfilePreset::AGGRESSIVE, 5, 1024, 100, 1.2);
}

PerformanceProfile PerformanceProfile::maximum() {
    return make_preset(ProfilePreset::MAXIMUM, 8, 2048, 50, 1.0);
}

PerformanceProfile PerformanceProfile::from_preset(ProfilePreset preset) {
    switch (preset) {
        case ProfilePreset::CONSERVATIVE: return conservative();
        case ProfilePreset::AGGRESSIVE: return aggressive();
        case ProfilePreset::MAXIMUM: return maximum();
        case ProfilePreset::BALANCED:
        case ProfilePreset::CUSTOM:
            break;
    }
    return balanced();
}

PerformanceProfile PerformanceProfile::from_name(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(core::utils::StringUtils::trim(name));
    
    if (lower == "conservative") return conservative();
    if (lower == "aggressive") return aggressive();
    if (lower == "maximum") return maximum();
    
    return balanced();
}

PerformanceProfile PerformanceProfile::from_config(const core::Config& config) {
    auto profile = from_name(config.get_string("profile.preset", "balanced"));
    bool customized = false;
    
    if (auto value = config.get_as<uint32_t>("profile.max_concurrent")) {
        profile.max_concurrent = *value;
        customized = true;
    }
    if (auto value = config.get_as<uint64_t>("profile.chunk_size_kb")) {
        profile.chunk_size_bytes = *value * KIB;
        customized = true;
    }
    if (auto value = config.get_as<uint64_t>("profile.buffer_size_kb")) {
        profile.buffer_size_bytes = *value * KIB;
        customized = true;
    }
    if (auto value = config.get_as<int64_t>("profile.inter_file_delay_ms")) {
        profile.inter_file_delay = std::chrono::milliseconds(*value);
        customized = true;
    }
    if (auto value = config.get_as<double>("profile.flood_wait_multiplier")) {
        profile.flood_wait_multiplier = *value;
        customized = true;
    }
    if (auto value = config.get_as<uint32_t>("profile.max_chunk_retries")) {
        profile.max_chunk_retries = *value;
        customized = true;
    }
    if (auto value = config.get_as<int64_t>("profile.retry_base_delay_ms")) {
        profile.retry_base_delay = std::chrono::milliseconds(*value);
        customized = true;
    }
    if (auto value = config.get_as<uint32_t>("profile.max_rate_limit_retries")) {
        profile.max_rate_limit_retries = *value;
        customized = true;
    }
    if (auto value = config.get_as<int64_t>("profile.progress_interval_ms")) {
        profile.progress_interval = std::chrono::milliseconds(*value);
        customized = true;
    }
    
    if (customized) {
        profile.preset = ProfilePreset::CUSTOM;
    }
    
    return profile;
}

std::vector<PerformanceProfile> PerformanceProfile::presets() {
    return {conservative(), balanced(), aggressive(), maximum()};
}

TransferResult PerformanceProfile::validate() const {
    if (max_concurrent < 1) {
        return TransferResult(TransferError::INVALID_PROFILE, "max_concurrent must be at least 1");
    }
    if (chunk_size_bytes == 0 || chunk_size_bytes > MAX_CHUNK_SIZE) {
        return TransferResult(TransferError::INVALID_PROFILE,
                              "chunk_size_bytes must be in (0, " + std::to_string(MAX_CHUNK_SIZE) + "]");
    }
    if (buffer_size_bytes == 0) {
        return TransferResult(TransferError::INVALID_PROFILE, "buffer_size_bytes must be positive");
    }
    if (inter_file_delay.count() < 0 || retry_base_delay.count() < 0 ||
        retry_max_delay.count() < 0 || progress_interval.count() < 0) {
        return TransferResult(TransferError::INVALID_PROFILE, "delays must not be negative");
    }
    if (flood_wait_multiplier < 1.0) {
        return TransferResult(TransferError::INVALID_PROFILE, "flood_wait_multiplier must be at least 1.0");
    }
    
    return TransferResult();
}

std::string PerformanceProfile::describe() const {
    using core::utils::StringUtils;
    
    std::ostringstream oss;
    oss << to_string(preset)
        << ": concurrent=" << max_concurrent
        << " chunk=" << StringUtils::format_bytes(chunk_size_bytes)
        << " buffer=" << StringUtils::format_bytes(buffer_size_bytes)
        << " delay=" << inter_file_delay.count() << "ms"
        << " flood_x" << flood_wait_multiplier;
    return oss.str();
}

} // namespace mediaferry::transfer
