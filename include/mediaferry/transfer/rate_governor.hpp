#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace mediaferry::transfer {

// Session-wide cooldown driven by remote flood-wait signals. Every worker on
// a session consults the same governor before each chunk request.
class RateGovernor {
public:
    using Clock = std::chrono::steady_clock;
    
    struct Admission {
        bool permitted;
        std::chrono::milliseconds wait;
        
        static Admission permit() { return {true, std::chrono::milliseconds(0)}; }
        static Admission wait_for(std::chrono::milliseconds duration) { return {false, duration}; }
    };
    
    RateGovernor();
    
    // Never blocks; reports the remaining cooldown instead
    Admission admit();
    
    // Extends the cooldown to now + suggested * multiplier. An existing
    // longer cooldown is kept. Returns the resulting deadline.
    Clock::time_point on_flood_wait(std::chrono::milliseconds suggested, double multiplier);
    
    void on_chunk_success();
    void reset();
    
    bool is_blocked() const;
    std::optional<Clock::time_point> blocked_until() const;
    std::chrono::milliseconds remaining() const;
    
    uint32_t consecutive_flood_waits() const;
    uint64_t total_flood_waits() const;
    
private:
    mutable std::mutex mutex_;
    std::optional<Clock::time_point> blocked_until_;
    uint32_t consecutive_flood_waits_;
    uint64_t total_flood_waits_;
    
    std::chrono::milliseconds remaining_locked(Clock::time_point now) const;
};

} // namespace mediaferry::transfer
