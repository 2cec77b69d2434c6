#include "mediaferry/transfer/session_context.hpp"
#include "mediaferry/core/logger.hpp"
#include <stdexcept>

namespace mediaferry::transfer {

SessionContext::SessionContext(std::string session_ref,
                               std::shared_ptr<remote::RemoteClient> client,
                               uint32_t max_concurrency)
    : session_ref_(std::move(session_ref))
    , client_(std::move(client))
    , max_concurrency_(max_concurrency == 0 ? 1 : max_concurrency)
    , attached_concurrency_(0)
    , attached_batches_(0)
{
    if (!client_) {
        throw std::invalid_argument("Session " + session_ref_ + " needs a remote client");
    }
}

std::chrono::milliseconds SessionContext::reserve_dispatch(std::chrono::milliseconds gap) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto now = std::chrono::steady_clock::now();
    if (last_dispatch_ && gap.count() > 0) {
        auto ready_at = *last_dispatch_ + gap;
        if (now < ready_at) {
            auto wait = std::chrono::ceil<std::chrono::milliseconds>(ready_at - now);
            return wait.count() > 0 ? wait : std::chrono::milliseconds(1);
        }
    }
    
    last_dispatch_ = now;
    return std::chrono::milliseconds(0);
}

TransferResult SessionContext::attach_batch(uint32_t max_concurrent) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (attached_concurrency_ + max_concurrent > max_concurrency_) {
        return TransferResult(TransferError::INVALID_STATE,
                              "Session " + session_ref_ + " already runs " +
                              std::to_string(attached_concurrency_) + " of " +
                              std::to_string(max_concurrency_) + " concurrent transfers");
    }
    
    attached_concurrency_ += max_concurrent;
    attached_batches_++;
    LOG_DEBUG("Session {} attached batch, concurrency {}/{}", session_ref_,
              attached_concurrency_, max_concurrency_);
    return TransferResult();
}

void SessionContext::detach_batch(uint32_t max_concurrent) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    attached_concurrency_ = attached_concurrency_ > max_concurrent ? attached_concurrency_ - max_concurrent : 0;
    if (attached_batches_ > 0) {
        attached_batches_--;
    }
}

uint32_t SessionContext::attached_concurrency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attached_concurrency_;
}

uint32_t SessionContext::attached_batches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attached_batches_;
}

} // namespace mediaferry::transfer
