#pragma once

#include "rate_governor.hpp"
#include "transfer_error.hpp"
#include "../remote/remote_client.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mediaferry::transfer {

// One authenticated remote handle and the cooldown state every batch on it
// shares. Batches attach with their concurrency; the combined total may not
// exceed what the session tolerates.
class SessionContext {
public:
    static constexpr uint32_t DEFAULT_MAX_CONCURRENCY = 8;
    
    SessionContext(std::string session_ref,
                   std::shared_ptr<remote::RemoteClient> client,
                   uint32_t max_concurrency = DEFAULT_MAX_CONCURRENCY);
    
    SessionContext(const SessionContext&) = delete;
    SessionContext& operator=(const SessionContext&) = delete;
    
    const std::string& session_ref() const { return session_ref_; }
    remote::RemoteClient& client() { return *client_; }
    RateGovernor& governor() { return governor_; }
    
    // Claims the next dispatch slot when `gap` has passed since the previous
    // one. Returns zero on success, otherwise how long the caller must wait.
    std::chrono::milliseconds reserve_dispatch(std::chrono::milliseconds gap);
    
    TransferResult attach_batch(uint32_t max_concurrent);
    void detach_batch(uint32_t max_concurrent);
    
    uint32_t attached_concurrency() const;
    uint32_t attached_batches() const;
    uint32_t max_concurrency() const { return max_concurrency_; }
    
private:
    std::string session_ref_;
    std::shared_ptr<remote::RemoteClient> client_;
    uint32_t max_concurrency_;
    RateGovernor governor_;
    
    mutable std::mutex mutex_;
    std::optional<std::chrono::steady_clock::time_point> last_dispatch_;
    uint32_t attached_concurrency_;
    uint32_t attached_batches_;
};

} // namespace mediaferry::transfer
