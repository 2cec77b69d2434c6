#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace mediaferry::transfer {

// Cooperative cancellation flag shared by a batch and its workers
class CancelToken {
public:
    CancelToken() : cancelled_(false) {}
    
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }
    
    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }
    
    // Sleeps for `duration` unless cancelled first. Returns false on cancel.
    bool wait_for(std::chrono::milliseconds duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }
    
private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_;
};

} // namespace mediaferry::transfer
