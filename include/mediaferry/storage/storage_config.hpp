#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace mediaferry::core {
class Config;
}

namespace mediaferry::storage {

struct StorageConfig {
    // In-progress bytes live beside the destination under this suffix and
    // are renamed onto the destination only once complete
    std::string partial_suffix = ".part";
    
    bool history_enabled = false;
    std::filesystem::path history_database = "mediaferry_history.db";
    
    bool verify_digest = false;
    
    // Refuse to start a transfer that would not fit on the destination volume
    bool check_free_space = true;
    
    StorageConfig() = default;
    
    static StorageConfig from_config(const core::Config& config);
    
    bool validate() const;
    
    std::filesystem::path partial_path(const std::filesystem::path& destination) const;
    
    static uint64_t get_available_space(const std::filesystem::path& directory);
    
    bool has_sufficient_space(const std::filesystem::path& directory, uint64_t required_bytes) const;
};

} // namespace mediaferry::storage
