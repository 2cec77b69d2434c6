#pragma once

#include "cancel_token.hpp"
#include "performance_profile.hpp"
#include "session_context.hpp"
#include "transfer_types.hpp"
#include "../storage/storage_config.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace mediaferry::transfer {

enum class FetchStatus {
    COMPLETED,
    RETRY_AFTER,  // parked on the session cooldown; requeue and resume later
    FAILED,
    CANCELLED
};

const char* to_string(FetchStatus status);

struct FetchOutcome {
    FetchStatus status = FetchStatus::COMPLETED;
    
    // Bytes durably in the partial (or final) file when the fetch returned
    uint64_t offset = 0;
    
    std::chrono::milliseconds retry_after{0};
    
    // True when this descriptor received the flood wait itself, false when
    // it only found the session already cooling down
    bool rate_limited = false;
    
    uint32_t transient_retries = 0;
    TransferResult error;
    std::string digest;
};

// Invoked after every written chunk with the new offset and chunk count
using ChunkCallback = std::function<void(uint64_t offset, uint64_t chunk_index)>;

// Pulls one item through the remote client in chunk_size_bytes requests,
// writing into the item's partial file. Consults the session governor
// before every request and never sleeps on it: a blocked session parks the
// fetch and hands the wait back to the caller.
class ChunkFetcher {
public:
    ChunkFetcher(SessionContext& session,
                 const PerformanceProfile& profile,
                 const storage::StorageConfig& storage);
    
    FetchOutcome fetch(const TransferDescriptor& descriptor,
                       uint64_t start_offset,
                       const CancelToken& cancel,
                       const ChunkCallback& on_chunk = nullptr);
    
private:
    SessionContext& session_;
    PerformanceProfile profile_;
    storage::StorageConfig storage_;
};

} // namespace mediaferry::transfer
