#pragma once

#include "../transfer/transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace mediaferry::storage {

struct TransferRecord {
    std::string batch_id;
    std::string session_ref;
    std::string channel_ref;
    int64_t item_id = 0;
    transfer::MediaKind media_kind = transfer::MediaKind::DOCUMENT;
    std::string destination_path;
    uint64_t bytes_transferred = 0;
    int64_t expected_size = transfer::UNKNOWN_SIZE;
    transfer::TransferStatus status = transfer::TransferStatus::COMPLETED;
    std::string error;
    std::string digest;
    std::chrono::system_clock::time_point finished_at;
};

// Outcome log of finished descriptors. Informational only: resume decisions
// never consult it.
class HistoryStore {
public:
    explicit HistoryStore(const std::filesystem::path& db_path);
    ~HistoryStore();
    
    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;
    
    bool initialize();
    
    bool record(const TransferRecord& record);
    
    // Latest record for one remote item
    std::optional<TransferRecord> find(const std::string& channel_ref, int64_t item_id);
    
    std::vector<TransferRecord> list_recent(size_t limit);
    std::vector<TransferRecord> list_batch(const std::string& batch_id);
    
    size_t count();
    
private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
    
    bool create_tables();
    std::vector<TransferRecord> query(const std::string& sql,
                                      const std::string& text_param,
                                      int64_t int_param);
};

} // namespace mediaferry::storage
