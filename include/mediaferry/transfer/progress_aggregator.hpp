#pragma once

#include "transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace mediaferry::transfer {

struct ProgressEvent {
    int64_t descriptor_id = 0;
    TransferStatus status = TransferStatus::QUEUED;
    uint64_t bytes_transferred = 0;
    int64_t expected_size = UNKNOWN_SIZE;
    std::optional<TransferResult> error;
};

struct ItemProgress {
    int64_t descriptor_id = 0;
    TransferStatus status = TransferStatus::QUEUED;
    uint64_t bytes_transferred = 0;
    int64_t expected_size = UNKNOWN_SIZE;
    double percentage_complete = 0.0;
    uint64_t current_speed_bps = 0;
    uint64_t average_speed_bps = 0;
    std::chrono::milliseconds estimated_time_remaining{0};
    std::optional<TransferResult> error;
};

struct BatchSummary {
    size_t total = 0;
    size_t queued = 0;
    size_t active = 0;
    size_t completed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    uint64_t bytes_transferred = 0;
    uint64_t expected_bytes = 0;
    double percentage_complete = 0.0;
    std::chrono::milliseconds elapsed{0};
    bool finished = false;
    
    size_t terminal() const { return completed + skipped + failed + cancelled; }
};

// Collects per-descriptor events from workers and hands them to the
// presentation layer, either pushed to subscribers or pulled via drain().
// Byte-only updates for an item are coalesced to one per interval; status
// changes always pass. Per item, bytes never decrease and nothing follows a
// terminal status. The pull queue is bounded and drops its oldest entries.
// Callbacks run on the publishing thread; they may read snapshots but must
// not subscribe, unsubscribe or publish.
class ProgressAggregator {
public:
    using EventCallback = std::function<void(const ProgressEvent&)>;
    using SummaryCallback = std::function<void(const BatchSummary&)>;
    
    static constexpr size_t DEFAULT_QUEUE_CAPACITY = 1024;
    
    explicit ProgressAggregator(std::chrono::milliseconds interval,
                                size_t queue_capacity = DEFAULT_QUEUE_CAPACITY);
    
    void track(int64_t descriptor_id, int64_t expected_size);
    
    // Returns true when the event was emitted, false when coalesced or
    // rejected as a regression
    bool publish(const ProgressEvent& event);
    
    void finish(const BatchSummary& summary);
    
    size_t subscribe(EventCallback callback);
    void unsubscribe(size_t subscription_id);
    void on_batch_complete(SummaryCallback callback);
    
    std::vector<ProgressEvent> drain(size_t max_events = std::numeric_limits<size_t>::max());
    
    std::optional<ItemProgress> item(int64_t descriptor_id) const;
    std::vector<ItemProgress> items() const;
    BatchSummary totals() const;
    
    uint64_t emitted_events() const;
    uint64_t coalesced_events() const;
    uint64_t dropped_events() const;
    
private:
    using TimePoint = std::chrono::steady_clock::time_point;
    
    struct ItemData {
        TransferStatus status = TransferStatus::QUEUED;
        uint64_t bytes_transferred = 0;
        int64_t expected_size = UNKNOWN_SIZE;
        std::optional<TransferResult> error;
        
        uint64_t emitted_bytes = 0;
        std::optional<TimePoint> last_emit;
        
        std::optional<TimePoint> first_sample;
        uint64_t first_sample_bytes = 0;
        std::deque<std::pair<TimePoint, uint64_t>> samples;
    };
    
    std::chrono::milliseconds interval_;
    size_t queue_capacity_;
    
    mutable std::mutex mutex_;
    std::map<int64_t, ItemData> items_;
    std::vector<int64_t> order_;
    std::deque<ProgressEvent> queue_;
    std::optional<TimePoint> started_;
    std::optional<BatchSummary> final_summary_;
    
    std::mutex callback_mutex_;
    std::map<size_t, EventCallback> subscribers_;
    std::vector<SummaryCallback> summary_callbacks_;
    size_t next_subscription_;
    
    uint64_t emitted_;
    uint64_t coalesced_;
    uint64_t dropped_;
    
    void prune_samples(ItemData& item, TimePoint now);
    ItemProgress make_progress(int64_t descriptor_id, const ItemData& item, TimePoint now) const;
    BatchSummary totals_locked(TimePoint now) const;
    void deliver(const ProgressEvent& event);
    
    static constexpr std::chrono::seconds HISTORY_WINDOW{30};
    static constexpr std::chrono::seconds SPEED_WINDOW{1};
};

} // namespace mediaferry::transfer
