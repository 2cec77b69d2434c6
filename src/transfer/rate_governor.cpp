#include "mediaferry/transfer/rate_governor.hpp"
#include "mediaferry/core/logger.hpp"
#include <algorithm>

namespace mediaferry::transfer {

RateGovernor::RateGovernor()
    : consecutive_flood_waits_(0)
    , total_flood_waits_(0)
{
}

RateGovernor::Admission RateGovernor::admit() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto now = Clock::now();
    if (blocked_until_ && now < *blocked_until_) {
        return Admission::wait_for(remaining_locked(now));
    }
    
    // Cooldown elapsed: back to open
    blocked_until_.reset();
    return Admission::permit();
}

RateGovernor::Clock::time_point RateGovernor::on_flood_wait(std::chrono::milliseconds suggested,
                                                            double multiplier) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto scaled = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double, std::milli>(
            static_cast<double>(std::max<int64_t>(suggested.count(), 0)) * std::max(multiplier, 1.0)));
    auto candidate = Clock::now() + scaled;
    
    if (!blocked_until_ || candidate > *blocked_until_) {
        blocked_until_ = candidate;
    }
    
    consecutive_flood_waits_++;
    total_flood_waits_++;
    
    LOG_WARN("Flood wait of {}ms (x{}), session blocked for {}ms, consecutive={}",
             suggested.count(), multiplier, remaining_locked(Clock::now()).count(),
             consecutive_flood_waits_);
    
    return *blocked_until_;
}

void RateGovernor::on_chunk_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_flood_waits_ = 0;
}

void RateGovernor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_until_.reset();
    consecutive_flood_waits_ = 0;
}

bool RateGovernor::is_blocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_until_ && Clock::now() < *blocked_until_;
}

std::optional<RateGovernor::Clock::time_point> RateGovernor::blocked_until() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_until_;
}

std::chrono::milliseconds RateGovernor::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining_locked(Clock::now());
}

uint32_t RateGovernor::consecutive_flood_waits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_flood_waits_;
}

uint64_t RateGovernor::total_flood_waits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_flood_waits_;
}

std::chrono::milliseconds RateGovernor::remaining_locked(Clock::time_point now) const {
    if (!blocked_until_ || now >= *blocked_until_) {
        return std::chrono::milliseconds(0);
    }
    // Round up so a caller sleeping for the reported wait never wakes early
    return std::chrono::ceil<std::chrono::milliseconds>(*blocked_until_ - now);
}

} // namespace mediaferry::transfer
