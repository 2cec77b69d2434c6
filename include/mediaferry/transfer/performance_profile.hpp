#pragma once

#include "transfer_error.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mediaferry::core {
class Config;
}

namespace mediaferry::transfer {

enum class ProfilePreset {
    CONSERVATIVE,
    BALANCED,
    AGGRESSIVE,
    MAXIMUM,
    CUSTOM
};

const char* to_string(ProfilePreset preset);

// Throughput/safety knobs for one batch. Copied into the batch at submit
// time, so later edits never reach a running batch.
struct PerformanceProfile {
    static constexpr uint64_t MAX_CHUNK_SIZE = 2 * 1024 * 1024;
    
    ProfilePreset preset = ProfilePreset::BALANCED;
    
    uint32_t max_concurrent = 3;
    uint64_t chunk_size_bytes = 512 * 1024;
    uint64_t buffer_size_bytes = 1024 * 1024;
    std::chrono::milliseconds inter_file_delay{300};
    double flood_wait_multiplier = 1.5;
    
    // Local per-chunk backoff, distinct from the session cooldown
    uint32_t max_chunk_retries = 5;
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds retry_max_delay{30000};
    
    // How many flood waits one descriptor may absorb before it fails
    uint32_t max_rate_limit_retries = 3;
    
    std::chrono::milliseconds progress_interval{500};
    
    static PerformanceProfile conservative();
    static PerformanceProfile balanced();
    static PerformanceProfile aggressive();
    static PerformanceProfile maximum();
    
    static PerformanceProfile from_preset(ProfilePreset preset);
    
    // Case-insensitive; unknown names fall back to balanced
    static PerformanceProfile from_name(const std::string& name);
    
    // Named preset from "profile.preset" with individual "profile.*" overrides
    static PerformanceProfile from_config(const core::Config& config);
    
    static std::vector<PerformanceProfile> presets();
    
    TransferResult validate() const;
    
    std::string describe() const;
};

} // namespace mediaferry::transfer
