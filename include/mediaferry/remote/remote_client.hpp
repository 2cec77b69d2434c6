#pragma once

#include "../transfer/transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mediaferry::remote {

enum class RemoteStatus {
    OK,
    END_OF_DATA,
    RATE_LIMITED,
    TRANSIENT_FAILURE,
    PERMANENT_FAILURE
};

const char* to_string(RemoteStatus status);

struct RemoteResult {
    RemoteStatus status;
    std::chrono::milliseconds retry_after;
    std::string message;
    
    RemoteResult(RemoteStatus st = RemoteStatus::OK,
                 std::string msg = "",
                 std::chrono::milliseconds retry = std::chrono::milliseconds(0))
        : status(st), retry_after(retry), message(std::move(msg)) {}
    
    static RemoteResult ok() { return RemoteResult(); }
    static RemoteResult end_of_data() { return RemoteResult(RemoteStatus::END_OF_DATA); }
    static RemoteResult rate_limited(std::chrono::milliseconds retry_after) {
        return RemoteResult(RemoteStatus::RATE_LIMITED, "flood wait", retry_after);
    }
    static RemoteResult transient(std::string msg) {
        return RemoteResult(RemoteStatus::TRANSIENT_FAILURE, std::move(msg));
    }
    static RemoteResult permanent(std::string msg) {
        return RemoteResult(RemoteStatus::PERMANENT_FAILURE, std::move(msg));
    }
    
    bool success() const { return status == RemoteStatus::OK; }
};

// Byte stream of one remote item, positioned at the offset it was opened with
class RemoteStream {
public:
    virtual ~RemoteStream() = default;
    
    // One chunk request. Fills `out` with at most `max_bytes` bytes and
    // returns OK, or END_OF_DATA with `out` empty once the item is exhausted.
    virtual RemoteResult read(size_t max_bytes, std::vector<uint8_t>& out) = 0;
    
    // Total item size as the remote currently reports it, or UNKNOWN_SIZE
    virtual int64_t reported_size() const = 0;
};

// Wire-protocol collaborator. Implementations must be safe to call from
// several worker threads at once.
class RemoteClient {
public:
    virtual ~RemoteClient() = default;
    
    virtual RemoteResult open_ranged_stream(const std::string& channel_ref,
                                            int64_t item_id,
                                            uint64_t start_offset,
                                            std::unique_ptr<RemoteStream>& stream) = 0;
    
    // Whether open_ranged_stream honours a non-zero start_offset for this kind
    virtual bool supports_ranged_fetch(transfer::MediaKind kind) const = 0;
};

} // namespace mediaferry::remote
