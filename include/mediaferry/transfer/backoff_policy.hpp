#pragma once

#include <chrono>
#include <cstdint>

namespace mediaferry::transfer {

// Exponential backoff for retrying one chunk after a transient failure.
// Local to a descriptor; the session cooldown lives in RateGovernor.
class BackoffPolicy {
public:
    BackoffPolicy(uint32_t max_retries,
                  std::chrono::milliseconds base_delay,
                  std::chrono::milliseconds max_delay);
    
    // Delay before retry number `attempt` (1-based): base * 2^(attempt-1), capped
    std::chrono::milliseconds delay_for(uint32_t attempt) const;
    
    bool exhausted(uint32_t attempt) const { return attempt > max_retries_; }
    uint32_t max_retries() const { return max_retries_; }
    
private:
    uint32_t max_retries_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
};

} // namespace mediaferry::transfer
