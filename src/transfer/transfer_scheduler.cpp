#include "mediaferry/transfer/transfer_scheduler.hpp"
#include "mediaferry/transfer/cancel_token.hpp"
#include "mediaferry/transfer/chunk_fetcher.hpp"
#include "mediaferry/crypto/random.hpp"
#include "mediaferry/core/logger.hpp"
#include "mediaferry/core/utils.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <set>
#include <thread>

namespace mediaferry::transfer {

struct TransferScheduler::Batch {
    Batch(BatchHandle batch_id,
          std::shared_ptr<SessionContext> batch_session,
          std::vector<TransferDescriptor> batch_descriptors,
          const PerformanceProfile& batch_profile,
          const storage::StorageConfig& storage)
        : id(std::move(batch_id))
        , session(std::move(batch_session))
        , descriptors(std::move(batch_descriptors))
        , profile(batch_profile)
        , fetcher(*session, profile, storage)
        , rate_limit_hits(descriptors.size(), 0)
        , active(0)
        , publishers(0)
        , finished(false)
        , started(std::chrono::steady_clock::now())
        , progress(std::make_shared<ProgressAggregator>(profile.progress_interval))
        , pool(profile.max_concurrent)
    {
        states.reserve(descriptors.size());
        for (size_t i = 0; i < descriptors.size(); ++i) {
            TransferState state;
            state.descriptor_id = descriptors[i].id;
            states.push_back(state);
            queue.push_back(i);
            progress->track(descriptors[i].id, descriptors[i].expected_size);
        }
    }
    
    BatchHandle id;
    std::shared_ptr<SessionContext> session;
    const std::vector<TransferDescriptor> descriptors;
    const PerformanceProfile profile;
    ChunkFetcher fetcher;
    
    std::vector<TransferState> states;
    std::vector<uint32_t> rate_limit_hits;
    std::deque<size_t> queue;
    uint32_t active;
    // Threads outside the pool still publishing terminal events
    uint32_t publishers;
    bool finished;
    BatchSummary summary;
    std::chrono::steady_clock::time_point started;
    
    CancelToken cancel;
    std::shared_ptr<ProgressAggregator> progress;
    boost::asio::thread_pool pool;
    
    std::mutex mutex;
    std::condition_variable cv;
    std::thread dispatcher;
};

TransferScheduler::TransferScheduler(const storage::StorageConfig& config,
                                     std::shared_ptr<storage::HistoryStore> history)
    : config_(config)
    , gate_(config)
    , history_(std::move(history))
{
}

TransferScheduler::~TransferScheduler() {
    std::vector<std::shared_ptr<Batch>> batches;
    {
        std::lock_guard<std::mutex> lock(batches_mutex_);
        for (auto& [id, batch] : batches_) {
            batches.push_back(batch);
        }
        batches_.clear();
    }
    
    for (auto& batch : batches) {
        cancel_and_publish(*batch);
        
        if (batch->dispatcher.joinable()) {
            batch->dispatcher.join();
        }
    }
}

TransferResult TransferScheduler::submit(std::shared_ptr<SessionContext> session,
                                         std::vector<TransferDescriptor> descriptors,
                                         const PerformanceProfile& profile,
                                         BatchHandle& handle,
                                         ProgressAggregator::EventCallback on_progress) {
    if (!session) {
        return TransferResult(TransferError::INVALID_STATE, "No session context");
    }
    
    auto valid = profile.validate();
    if (!valid) {
        return valid;
    }
    
    std::set<int64_t> ids;
    std::set<std::filesystem::path> destinations;
    for (auto& descriptor : descriptors) {
        if (descriptor.session_ref.empty()) {
            descriptor.session_ref = session->session_ref();
        } else if (descriptor.session_ref != session->session_ref()) {
            return TransferResult(TransferError::INVALID_DESCRIPTOR,
                                  "Descriptor " + std::to_string(descriptor.id) + " belongs to session " +
                                  descriptor.session_ref + ", not " + session->session_ref());
        }
        
        if (descriptor.destination_path.empty()) {
            return TransferResult(TransferError::INVALID_DESCRIPTOR,
                                  "Descriptor " + std::to_string(descriptor.id) + " has no destination");
        }
        
        if (!ids.insert(descriptor.id).second) {
            return TransferResult(TransferError::INVALID_DESCRIPTOR,
                                  "Duplicate descriptor id " + std::to_string(descriptor.id));
        }
        
        if (!destinations.insert(descriptor.destination_path.lexically_normal()).second) {
            return TransferResult(TransferError::INVALID_DESCRIPTOR,
                                  "Destination " + descriptor.destination_path.string() + " used twice");
        }
    }
    
    auto attached = session->attach_batch(profile.max_concurrent);
    if (!attached) {
        return attached;
    }
    
    auto batch = std::make_shared<Batch>(generate_batch_handle(), session, std::move(descriptors), profile, config_);
    if (on_progress) {
        batch->progress->subscribe(std::move(on_progress));
    }
    handle = batch->id;
    
    LOG_INFO("Batch {} submitted on session {}: {} descriptors, {}",
             batch->id, session->session_ref(), batch->descriptors.size(), profile.describe());
    
    {
        std::lock_guard<std::mutex> lock(batches_mutex_);
        batches_[batch->id] = batch;
    }
    
    // The map keeps the batch alive until drain(), which joins this thread
    batch->dispatcher = std::thread([this, raw = batch.get()]() {
        run_dispatcher(*raw);
    });
    
    return TransferResult();
}

TransferResult TransferScheduler::cancel(const BatchHandle& handle) {
    auto batch = find_batch(handle);
    if (!batch) {
        return TransferResult(TransferError::NOT_FOUND, "Unknown batch " + handle);
    }
    
    auto dropped = cancel_and_publish(*batch);
    if (dropped) {
        LOG_INFO("Batch {} cancelled, {} queued descriptors dropped", handle, *dropped);
    }
    return TransferResult();
}

std::optional<size_t> TransferScheduler::cancel_and_publish(Batch& batch) {
    std::vector<ProgressEvent> events;
    {
        std::lock_guard<std::mutex> lock(batch.mutex);
        if (batch.finished) {
            return std::nullopt;
        }
        batch.cancel.cancel();
        cancel_queued(batch, events);
        batch.publishers++;
    }
    batch.cv.notify_all();
    
    for (const auto& event : events) {
        batch.progress->publish(event);
    }
    
    // The dispatcher signals completion only after this
    {
        std::lock_guard<std::mutex> lock(batch.mutex);
        batch.publishers--;
    }
    batch.cv.notify_all();
    return events.size();
}

TransferResult TransferScheduler::snapshot(const BatchHandle& handle, std::vector<TransferState>& states) const {
    auto batch = find_batch(handle);
    if (!batch) {
        return TransferResult(TransferError::NOT_FOUND, "Unknown batch " + handle);
    }
    
    std::lock_guard<std::mutex> lock(batch->mutex);
    states = batch->states;
    return TransferResult();
}

std::shared_ptr<ProgressAggregator> TransferScheduler::progress(const BatchHandle& handle) const {
    auto batch = find_batch(handle);
    return batch ? batch->progress : nullptr;
}

bool TransferScheduler::wait(const BatchHandle& handle, std::chrono::milliseconds timeout, BatchSummary& summary) {
    auto batch = find_batch(handle);
    if (!batch) {
        return false;
    }
    
    std::unique_lock<std::mutex> lock(batch->mutex);
    if (!batch->cv.wait_for(lock, timeout, [&batch] { return batch->finished; })) {
        return false;
    }
    
    summary = batch->summary;
    return true;
}

BatchSummary TransferScheduler::wait(const BatchHandle& handle) {
    auto batch = find_batch(handle);
    if (!batch) {
        return BatchSummary{};
    }
    
    std::unique_lock<std::mutex> lock(batch->mutex);
    batch->cv.wait(lock, [&batch] { return batch->finished; });
    return batch->summary;
}

TransferResult TransferScheduler::drain(const BatchHandle& handle, std::vector<TransferState>& states) {
    auto batch = find_batch(handle);
    if (!batch) {
        return TransferResult(TransferError::NOT_FOUND, "Unknown batch " + handle);
    }
    
    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        if (!batch->finished) {
            return TransferResult(TransferError::INVALID_STATE, "Batch " + handle + " is still running");
        }
        states = batch->states;
    }
    
    if (batch->dispatcher.joinable()) {
        batch->dispatcher.join();
    }
    
    std::lock_guard<std::mutex> lock(batches_mutex_);
    batches_.erase(handle);
    return TransferResult();
}

size_t TransferScheduler::batch_count() const {
    std::lock_guard<std::mutex> lock(batches_mutex_);
    return batches_.size();
}

std::shared_ptr<TransferScheduler::Batch> TransferScheduler::find_batch(const BatchHandle& handle) const {
    std::lock_guard<std::mutex> lock(batches_mutex_);
    auto it = batches_.find(handle);
    return it != batches_.end() ? it->second : nullptr;
}

void TransferScheduler::run_dispatcher(Batch& batch) {
    auto& session = *batch.session;
    
    while (true) {
        size_t index = 0;
        {
            std::unique_lock<std::mutex> lock(batch.mutex);
            batch.cv.wait(lock, [&batch] {
                return batch.cancel.is_cancelled() ||
                       (batch.queue.empty() && batch.active == 0) ||
                       (!batch.queue.empty() && batch.active < batch.profile.max_concurrent);
            });
            
            if (batch.cancel.is_cancelled() || batch.queue.empty()) {
                break;
            }
            
            // The session cooldown holds back every new dispatch
            auto cooldown = session.governor().remaining();
            if (cooldown.count() > 0) {
                batch.cv.wait_for(lock, cooldown);
                continue;
            }
            
            index = batch.queue.front();
            batch.queue.pop_front();
        }
        
        const auto& descriptor = batch.descriptors[index];
        bool ranged = session.client().supports_ranged_fetch(descriptor.media_kind);
        auto decision = gate_.evaluate(descriptor, ranged);
        
        LOG_DEBUG("Batch {} item {}: {} ({})", batch.id, descriptor.id,
                  storage::to_string(decision.verdict), decision.reason);
        
        std::optional<ProgressEvent> started;
        std::optional<ProgressEvent> event;
        std::optional<TransferState> finished_state;
        
        if (decision.verdict == storage::GateVerdict::SKIP ||
            decision.verdict == storage::GateVerdict::REJECT) {
            {
                std::lock_guard<std::mutex> lock(batch.mutex);
                if (decision.verdict == storage::GateVerdict::SKIP) {
                    event = transition(batch, index, TransferStatus::SKIPPED);
                } else {
                    // Failures always pass through IN_PROGRESS
                    LOG_ERROR("Batch {} item {} failed: {}", batch.id, descriptor.id, decision.error.message);
                    started = transition(batch, index, TransferStatus::IN_PROGRESS);
                    event = transition(batch, index, TransferStatus::FAILED, decision.error);
                }
                if (event) {
                    finished_state = batch.states[index];
                }
            }
            if (started) {
                batch.progress->publish(*started);
            }
            if (event) {
                batch.progress->publish(*event);
                record_history(batch, *finished_state);
            }
            continue;
        }
        
        // Pacing between two dispatches on the same session
        bool cancelled = false;
        while (true) {
            auto gap = session.reserve_dispatch(batch.profile.inter_file_delay);
            if (gap.count() == 0) {
                break;
            }
            if (!batch.cancel.wait_for(gap)) {
                cancelled = true;
                break;
            }
        }
        
        {
            std::lock_guard<std::mutex> lock(batch.mutex);
            if (cancelled || batch.cancel.is_cancelled()) {
                event = transition(batch, index, TransferStatus::CANCELLED);
                if (event) {
                    finished_state = batch.states[index];
                }
            } else {
                auto& state = batch.states[index];
                state.bytes_transferred = decision.start_offset;
                state.chunk_index = decision.start_offset / std::max<uint64_t>(batch.profile.chunk_size_bytes, 1);
                event = transition(batch, index,
                                   decision.verdict == storage::GateVerdict::RESUME ?
                                       TransferStatus::RESUMING : TransferStatus::IN_PROGRESS);
                batch.active++;
            }
        }
        
        if (event) {
            batch.progress->publish(*event);
        }
        if (finished_state) {
            record_history(batch, *finished_state);
            continue;
        }
        
        boost::asio::post(batch.pool, [this, &batch, index, offset = decision.start_offset]() {
            run_descriptor(batch, index, offset);
        });
    }
    
    // Drain workers still finishing their current chunk
    {
        std::unique_lock<std::mutex> lock(batch.mutex);
        batch.cv.wait(lock, [&batch] { return batch.active == 0 && batch.publishers == 0; });
    }
    batch.pool.join();
    
    std::vector<ProgressEvent> events;
    {
        std::lock_guard<std::mutex> lock(batch.mutex);
        cancel_queued(batch, events);
    }
    for (const auto& event : events) {
        batch.progress->publish(event);
    }
    
    BatchSummary summary;
    {
        std::lock_guard<std::mutex> lock(batch.mutex);
        summary = summarize(batch);
    }
    
    session.detach_batch(batch.profile.max_concurrent);
    
    LOG_INFO("Batch {} finished in {}: {} completed, {} skipped, {} failed, {} cancelled, {}",
             batch.id, core::utils::StringUtils::format_duration(summary.elapsed),
             summary.completed, summary.skipped, summary.failed, summary.cancelled,
             core::utils::StringUtils::format_bytes(summary.bytes_transferred));
    
    batch.progress->finish(summary);
    
    {
        std::lock_guard<std::mutex> lock(batch.mutex);
        batch.summary = summary;
        batch.finished = true;
    }
    batch.cv.notify_all();
}

void TransferScheduler::run_descriptor(Batch& batch, size_t index, uint64_t start_offset) {
    const auto& descriptor = batch.descriptors[index];
    
    auto outcome = batch.fetcher.fetch(descriptor, start_offset, batch.cancel,
        [this, &batch, index](uint64_t offset, uint64_t chunk_index) {
            std::optional<ProgressEvent> event;
            {
                std::lock_guard<std::mutex> lock(batch.mutex);
                auto& state = batch.states[index];
                state.bytes_transferred = offset;
                state.chunk_index = chunk_index;
                if (state.status == TransferStatus::RESUMING) {
                    event = transition(batch, index, TransferStatus::IN_PROGRESS);
                } else {
                    event = make_event(batch, index);
                }
            }
            if (event) {
                batch.progress->publish(*event);
            }
        });
    
    std::vector<ProgressEvent> events;
    std::optional<TransferState> finished_state;
    {
        std::lock_guard<std::mutex> lock(batch.mutex);
        auto& state = batch.states[index];
        state.retry_count += outcome.transient_retries;
        state.bytes_transferred = outcome.offset;
        
        auto push = [&events](std::optional<ProgressEvent> event) {
            if (event) {
                events.push_back(std::move(*event));
            }
        };
        auto push_failed = [&](TransferResult error) {
            if (state.status == TransferStatus::RESUMING) {
                push(transition(batch, index, TransferStatus::IN_PROGRESS));
            }
            push(transition(batch, index, TransferStatus::FAILED, std::move(error)));
        };
        
        switch (outcome.status) {
            case FetchStatus::COMPLETED:
                if (state.status == TransferStatus::RESUMING) {
                    push(transition(batch, index, TransferStatus::IN_PROGRESS));
                }
                state.digest = outcome.digest;
                push(transition(batch, index, TransferStatus::COMPLETED));
                break;
                
            case FetchStatus::RETRY_AFTER:
                if (outcome.rate_limited) {
                    batch.rate_limit_hits[index]++;
                    state.retry_count++;
                }
                if (batch.rate_limit_hits[index] > batch.profile.max_rate_limit_retries) {
                    TransferResult error(TransferError::RATE_LIMITED,
                                         "Flood wait retries exhausted after " +
                                         std::to_string(batch.rate_limit_hits[index]) + " attempts");
                    LOG_ERROR("Batch {} item {} failed: {}", batch.id, descriptor.id, error.message);
                    push_failed(error);
                } else if (batch.cancel.is_cancelled()) {
                    push(transition(batch, index, TransferStatus::CANCELLED));
                } else {
                    LOG_DEBUG("Batch {} item {} parked at {} for {}ms", batch.id, descriptor.id,
                              outcome.offset, outcome.retry_after.count());
                    push(transition(batch, index, TransferStatus::QUEUED));
                    auto position = std::lower_bound(batch.queue.begin(), batch.queue.end(), index);
                    batch.queue.insert(position, index);
                }
                break;
                
            case FetchStatus::FAILED:
                LOG_ERROR("Batch {} item {} failed: {} ({})", batch.id, descriptor.id,
                          outcome.error.message, to_string(outcome.error.error));
                push_failed(outcome.error);
                break;
                
            case FetchStatus::CANCELLED:
                push(transition(batch, index, TransferStatus::CANCELLED));
                break;
        }
        
        if (is_terminal(state.status)) {
            finished_state = state;
        }
    }
    
    for (const auto& event : events) {
        batch.progress->publish(event);
    }
    if (finished_state) {
        record_history(batch, *finished_state);
    }
    
    {
        std::lock_guard<std::mutex> lock(batch.mutex);
        batch.active--;
    }
    batch.cv.notify_all();
}

std::optional<ProgressEvent> TransferScheduler::transition(Batch& batch, size_t index, TransferStatus to,
                                                           std::optional<TransferResult> error) {
    auto& state = batch.states[index];
    if (!is_valid_transition(state.status, to)) {
        LOG_WARN("Batch {} item {}: refusing {} -> {}", batch.id, state.descriptor_id,
                 to_string(state.status), to_string(to));
        return std::nullopt;
    }
    
    state.status = to;
    if (error) {
        state.last_error = std::move(error);
    }
    return make_event(batch, index);
}

ProgressEvent TransferScheduler::make_event(const Batch& batch, size_t index) const {
    const auto& state = batch.states[index];
    
    ProgressEvent event;
    event.descriptor_id = state.descriptor_id;
    event.status = state.status;
    event.bytes_transferred = state.bytes_transferred;
    event.expected_size = batch.descriptors[index].expected_size;
    event.error = state.last_error;
    return event;
}

void TransferScheduler::cancel_queued(Batch& batch, std::vector<ProgressEvent>& events) {
    while (!batch.queue.empty()) {
        auto index = batch.queue.front();
        batch.queue.pop_front();
        if (auto event = transition(batch, index, TransferStatus::CANCELLED)) {
            events.push_back(std::move(*event));
            record_history(batch, batch.states[index]);
        }
    }
}

BatchSummary TransferScheduler::summarize(const Batch& batch) const {
    BatchSummary summary;
    summary.total = batch.states.size();
    
    for (size_t i = 0; i < batch.states.size(); ++i) {
        const auto& state = batch.states[i];
        switch (state.status) {
            case TransferStatus::QUEUED: summary.queued++; break;
            case TransferStatus::RESUMING:
            case TransferStatus::IN_PROGRESS: summary.active++; break;
            case TransferStatus::COMPLETED: summary.completed++; break;
            case TransferStatus::SKIPPED: summary.skipped++; break;
            case TransferStatus::FAILED: summary.failed++; break;
            case TransferStatus::CANCELLED: summary.cancelled++; break;
        }
        summary.bytes_transferred += state.bytes_transferred;
        if (batch.descriptors[i].has_known_size()) {
            summary.expected_bytes += static_cast<uint64_t>(batch.descriptors[i].expected_size);
        }
    }
    
    if (summary.expected_bytes > 0) {
        summary.percentage_complete = std::min(100.0,
            (static_cast<double>(summary.bytes_transferred) / static_cast<double>(summary.expected_bytes)) * 100.0);
    }
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - batch.started);
    summary.finished = summary.terminal() == summary.total;
    
    return summary;
}

void TransferScheduler::record_history(const Batch& batch, const TransferState& state) {
    if (!history_) {
        return;
    }
    
    auto it = std::find_if(batch.descriptors.begin(), batch.descriptors.end(),
                           [&state](const TransferDescriptor& d) { return d.id == state.descriptor_id; });
    if (it == batch.descriptors.end()) {
        return;
    }
    
    storage::TransferRecord record;
    record.batch_id = batch.id;
    record.session_ref = it->session_ref;
    record.channel_ref = it->channel_ref;
    record.item_id = it->id;
    record.media_kind = it->media_kind;
    record.destination_path = it->destination_path.string();
    record.bytes_transferred = state.bytes_transferred;
    record.expected_size = it->expected_size;
    record.status = state.status;
    record.error = state.last_error ? state.last_error->message : "";
    record.digest = state.digest;
    record.finished_at = std::chrono::system_clock::now();
    
    if (!history_->record(record)) {
        LOG_WARN("Could not record history for item {}", record.item_id);
    }
}

BatchHandle TransferScheduler::generate_batch_handle() {
    return "batch_" + crypto::SecureRandom::generate_hex(8);
}

} // namespace mediaferry::transfer
