#include "mediaferry/storage/storage_config.hpp"
#include "mediaferry/core/config.hpp"
#include "mediaferry/core/utils.hpp"
#include <limits>

namespace mediaferry::storage {

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig storage;
    storage.history_enabled = config.get_bool("history.enabled", storage.history_enabled);
    storage.history_database = core::utils::FileUtils::expand_home(
        config.get_string("history.database", storage.history_database.string()));
    storage.verify_digest = config.get_bool("verify.digest", storage.verify_digest);
    storage.check_free_space = config.get_bool("storage.check_free_space", storage.check_free_space);
    storage.partial_suffix = config.get_string("storage.partial_suffix", storage.partial_suffix);
    return storage;
}

bool StorageConfig::validate() const {
    if (partial_suffix.empty() || partial_suffix.find('/') != std::string::npos) {
        return false;
    }
    
    if (history_enabled && history_database.empty()) {
        return false;
    }
    
    return true;
}

std::filesystem::path StorageConfig::partial_path(const std::filesystem::path& destination) const {
    auto partial = destination;
    partial += partial_suffix;
    return partial;
}

uint64_t StorageConfig::get_available_space(const std::filesystem::path& directory) {
    std::error_code ec;
    auto space_info = std::filesystem::space(directory, ec);
    if (ec) {
        // Unknown volume: do not block the transfer on a failed probe
        return std::numeric_limits<uint64_t>::max();
    }
    return space_info.available;
}

bool StorageConfig::has_sufficient_space(const std::filesystem::path& directory, uint64_t required_bytes) const {
    if (!check_free_space) {
        return true;
    }
    return get_available_space(directory) >= required_bytes;
}

} // namespace mediaferry::storage
