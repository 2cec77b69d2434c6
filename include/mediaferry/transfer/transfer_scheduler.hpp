#pragma once

#include "performance_profile.hpp"
#include "progress_aggregator.hpp"
#include "session_context.hpp"
#include "transfer_types.hpp"
#include "../storage/history_store.hpp"
#include "../storage/resume_gate.hpp"
#include "../storage/storage_config.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mediaferry::transfer {

using BatchHandle = std::string;

// Runs batches of descriptors against a session. Each batch gets a
// dispatcher thread and a worker pool of profile.max_concurrent threads;
// the dispatcher is the only path into the pool, so at most max_concurrent
// descriptors of a batch are ever RESUMING or IN_PROGRESS.
//
// Dispatch is FIFO by submission order. A descriptor parked on a session
// cooldown goes back into the queue at its submission position.
class TransferScheduler {
public:
    explicit TransferScheduler(const storage::StorageConfig& config,
                               std::shared_ptr<storage::HistoryStore> history = nullptr);
    ~TransferScheduler();
    
    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;
    
    // The profile is copied; the batch never sees later changes to it.
    // `on_progress` is subscribed before the first dispatch.
    TransferResult submit(std::shared_ptr<SessionContext> session,
                          std::vector<TransferDescriptor> descriptors,
                          const PerformanceProfile& profile,
                          BatchHandle& handle,
                          ProgressAggregator::EventCallback on_progress = nullptr);
    
    // Queued descriptors become CANCELLED at once; running ones stop at
    // their next chunk boundary and keep their partial files.
    TransferResult cancel(const BatchHandle& handle);
    
    TransferResult snapshot(const BatchHandle& handle, std::vector<TransferState>& states) const;
    
    std::shared_ptr<ProgressAggregator> progress(const BatchHandle& handle) const;
    
    // False on timeout or unknown handle
    bool wait(const BatchHandle& handle, std::chrono::milliseconds timeout, BatchSummary& summary);
    BatchSummary wait(const BatchHandle& handle);
    
    // Returns the final states of a finished batch and forgets it
    TransferResult drain(const BatchHandle& handle, std::vector<TransferState>& states);
    
    size_t batch_count() const;
    
private:
    struct Batch;
    
    storage::StorageConfig config_;
    storage::ResumeGate gate_;
    std::shared_ptr<storage::HistoryStore> history_;
    
    mutable std::mutex batches_mutex_;
    std::unordered_map<BatchHandle, std::shared_ptr<Batch>> batches_;
    
    std::shared_ptr<Batch> find_batch(const BatchHandle& handle) const;
    
    void run_dispatcher(Batch& batch);
    void run_descriptor(Batch& batch, size_t index, uint64_t start_offset);
    
    // Caller holds batch.mutex
    std::optional<ProgressEvent> transition(Batch& batch, size_t index, TransferStatus to,
                                            std::optional<TransferResult> error = std::nullopt);
    ProgressEvent make_event(const Batch& batch, size_t index) const;
    void cancel_queued(Batch& batch, std::vector<ProgressEvent>& events);
    // Cancels queued descriptors and publishes their events; nullopt once finished
    std::optional<size_t> cancel_and_publish(Batch& batch);
    BatchSummary summarize(const Batch& batch) const;
    
    void record_history(const Batch& batch, const TransferState& state);
    
    static BatchHandle generate_batch_handle();
};

} // namespace mediaferry::transfer
