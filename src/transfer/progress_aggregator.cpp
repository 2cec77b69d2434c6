#include "mediaferry/transfer/progress_aggregator.hpp"
#include <algorithm>

namespace mediaferry::transfer {

ProgressAggregator::ProgressAggregator(std::chrono::milliseconds interval, size_t queue_capacity)
    : interval_(interval)
    , queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity)
    , next_subscription_(1)
    , emitted_(0)
    , coalesced_(0)
    , dropped_(0) {
}

void ProgressAggregator::track(int64_t descriptor_id, int64_t expected_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!started_) {
        started_ = std::chrono::steady_clock::now();
    }
    
    auto [it, inserted] = items_.try_emplace(descriptor_id);
    if (inserted) {
        it->second.expected_size = expected_size;
        order_.push_back(descriptor_id);
    }
}

bool ProgressAggregator::publish(const ProgressEvent& event) {
    std::lock_guard<std::mutex> delivery_lock(callback_mutex_);
    
    ProgressEvent emitted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        auto now = std::chrono::steady_clock::now();
        if (!started_) {
            started_ = now;
        }
        
        auto [it, inserted] = items_.try_emplace(event.descriptor_id);
        auto& item = it->second;
        if (inserted) {
            item.expected_size = event.expected_size;
            order_.push_back(event.descriptor_id);
        }
        
        if (is_terminal(item.status)) {
            coalesced_++;
            return false;
        }
        
        bool status_changed = event.status != item.status;
        if (status_changed && !is_valid_transition(item.status, event.status)) {
            coalesced_++;
            return false;
        }
        
        if (event.expected_size >= 0) {
            item.expected_size = event.expected_size;
        }
        if (event.error) {
            item.error = event.error;
        }
        item.status = event.status;
        
        if (event.bytes_transferred > item.bytes_transferred) {
            if (!item.first_sample) {
                item.first_sample = now;
                item.first_sample_bytes = item.bytes_transferred;
            }
            item.samples.emplace_back(now, event.bytes_transferred - item.bytes_transferred);
            item.bytes_transferred = event.bytes_transferred;
            prune_samples(item, now);
        }
        
        bool reached_end = item.expected_size >= 0 &&
                           item.bytes_transferred == static_cast<uint64_t>(item.expected_size);
        bool interval_elapsed = !item.last_emit || now - *item.last_emit >= interval_;
        bool bytes_moved = item.bytes_transferred != item.emitted_bytes;
        
        if (!status_changed && (!bytes_moved || (!interval_elapsed && !reached_end))) {
            coalesced_++;
            return false;
        }
        
        emitted.descriptor_id = event.descriptor_id;
        emitted.status = item.status;
        emitted.bytes_transferred = item.bytes_transferred;
        emitted.expected_size = item.expected_size;
        emitted.error = item.error;
        
        item.emitted_bytes = item.bytes_transferred;
        item.last_emit = now;
        
        if (queue_.size() >= queue_capacity_) {
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(emitted);
        emitted_++;
    }
    
    deliver(emitted);
    return true;
}

void ProgressAggregator::finish(const BatchSummary& summary) {
    std::lock_guard<std::mutex> delivery_lock(callback_mutex_);
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        final_summary_ = summary;
    }
    
    for (const auto& callback : summary_callbacks_) {
        callback(summary);
    }
}

size_t ProgressAggregator::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    auto id = next_subscription_++;
    subscribers_[id] = std::move(callback);
    return id;
}

void ProgressAggregator::unsubscribe(size_t subscription_id) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    subscribers_.erase(subscription_id);
}

void ProgressAggregator::on_batch_complete(SummaryCallback callback) {
    std::lock_guard<std::mutex> delivery_lock(callback_mutex_);
    
    std::optional<BatchSummary> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done = final_summary_;
    }
    
    // Late registration still sees the signal
    if (done) {
        callback(*done);
        return;
    }
    summary_callbacks_.push_back(std::move(callback));
}

std::vector<ProgressEvent> ProgressAggregator::drain(size_t max_events) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<ProgressEvent> events;
    auto count = std::min(max_events, queue_.size());
    events.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        events.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    return events;
}

std::optional<ItemProgress> ProgressAggregator::item(int64_t descriptor_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = items_.find(descriptor_id);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return make_progress(descriptor_id, it->second, std::chrono::steady_clock::now());
}

std::vector<ItemProgress> ProgressAggregator::items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto now = std::chrono::steady_clock::now();
    std::vector<ItemProgress> result;
    result.reserve(order_.size());
    for (auto id : order_) {
        result.push_back(make_progress(id, items_.at(id), now));
    }
    return result;
}

BatchSummary ProgressAggregator::totals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (final_summary_) {
        return *final_summary_;
    }
    return totals_locked(std::chrono::steady_clock::now());
}

uint64_t ProgressAggregator::emitted_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return emitted_;
}

uint64_t ProgressAggregator::coalesced_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return coalesced_;
}

uint64_t ProgressAggregator::dropped_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void ProgressAggregator::prune_samples(ItemData& item, TimePoint now) {
    auto cutoff = now - HISTORY_WINDOW;
    while (!item.samples.empty() && item.samples.front().first < cutoff) {
        item.samples.pop_front();
    }
}

ItemProgress ProgressAggregator::make_progress(int64_t descriptor_id, const ItemData& item, TimePoint now) const {
    ItemProgress progress;
    progress.descriptor_id = descriptor_id;
    progress.status = item.status;
    progress.bytes_transferred = item.bytes_transferred;
    progress.expected_size = item.expected_size;
    progress.error = item.error;
    
    if (item.expected_size > 0) {
        progress.percentage_complete =
            (static_cast<double>(item.bytes_transferred) / static_cast<double>(item.expected_size)) * 100.0;
    } else if (item.status == TransferStatus::COMPLETED || item.status == TransferStatus::SKIPPED) {
        progress.percentage_complete = 100.0;
    }
    
    if (is_terminal(item.status) || !item.first_sample) {
        return progress;
    }
    
    auto recent_cutoff = now - SPEED_WINDOW;
    uint64_t recent_bytes = 0;
    for (const auto& [timestamp, bytes] : item.samples) {
        if (timestamp >= recent_cutoff) {
            recent_bytes += bytes;
        }
    }
    progress.current_speed_bps = recent_bytes;
    
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - *item.first_sample);
    if (elapsed.count() > 0) {
        progress.average_speed_bps =
            ((item.bytes_transferred - item.first_sample_bytes) * 1000) / static_cast<uint64_t>(elapsed.count());
    }
    
    if (item.expected_size >= 0 && item.bytes_transferred < static_cast<uint64_t>(item.expected_size)) {
        uint64_t remaining = static_cast<uint64_t>(item.expected_size) - item.bytes_transferred;
        uint64_t speed = progress.current_speed_bps > 0 ? progress.current_speed_bps : progress.average_speed_bps;
        if (speed > 0) {
            progress.estimated_time_remaining = std::chrono::milliseconds((remaining * 1000) / speed);
        }
    }
    
    return progress;
}

BatchSummary ProgressAggregator::totals_locked(TimePoint now) const {
    BatchSummary summary;
    summary.total = items_.size();
    
    for (const auto& [id, item] : items_) {
        switch (item.status) {
            case TransferStatus::QUEUED: summary.queued++; break;
            case TransferStatus::RESUMING:
            case TransferStatus::IN_PROGRESS: summary.active++; break;
            case TransferStatus::COMPLETED: summary.completed++; break;
            case TransferStatus::SKIPPED: summary.skipped++; break;
            case TransferStatus::FAILED: summary.failed++; break;
            case TransferStatus::CANCELLED: summary.cancelled++; break;
        }
        summary.bytes_transferred += item.bytes_transferred;
        if (item.expected_size >= 0) {
            summary.expected_bytes += static_cast<uint64_t>(item.expected_size);
        }
    }
    
    if (summary.expected_bytes > 0) {
        summary.percentage_complete = std::min(100.0,
            (static_cast<double>(summary.bytes_transferred) / static_cast<double>(summary.expected_bytes)) * 100.0);
    }
    
    if (started_) {
        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - *started_);
    }
    summary.finished = summary.total > 0 && summary.terminal() == summary.total;
    
    return summary;
}

void ProgressAggregator::deliver(const ProgressEvent& event) {
    for (const auto& [id, callback] : subscribers_) {
        callback(event);
    }
}

} // namespace mediaferry::transfer
