#include "mediaferry/transfer/backoff_policy.hpp"
#include <algorithm>

namespace mediaferry::transfer {

BackoffPolicy::BackoffPolicy(uint32_t max_retries,
                             std::chrono::milliseconds base_delay,
                             std::chrono::milliseconds max_delay)
    : max_retries_(max_retries)
    , base_delay_(base_delay)
    , max_delay_(std::max(max_delay, base_delay))
{
}

std::chrono::milliseconds BackoffPolicy::delay_for(uint32_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds(0);
    }
    
    // Shift is clamped so large attempt counts cannot overflow
    uint32_t exponent = std::min<uint32_t>(attempt - 1, 20);
    auto delay = base_delay_.count() * (int64_t{1} << exponent);
    
    return std::chrono::milliseconds(std::min<int64_t>(delay, max_delay_.count()));
}

} // namespace mediaferry::transfer
