#include "mediaferry/transfer/chunk_fetcher.hpp"
#include "mediaferry/transfer/backoff_policy.hpp"
#include "mediaferry/storage/partial_file.hpp"
#include "mediaferry/crypto/file_digest.hpp"
#include "mediaferry/core/logger.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <memory>
#include <vector>

namespace mediaferry::transfer {

const char* to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::COMPLETED: return "completed";
        case FetchStatus::RETRY_AFTER: return "retry_after";
        case FetchStatus::FAILED: return "failed";
        case FetchStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

ChunkFetcher::ChunkFetcher(SessionContext& session,
                           const PerformanceProfile& profile,
                           const storage::StorageConfig& storage)
    : session_(session)
    , profile_(profile)
    , storage_(storage)
{
}

FetchOutcome ChunkFetcher::fetch(const TransferDescriptor& descriptor,
                                 uint64_t start_offset,
                                 const CancelToken& cancel,
                                 const ChunkCallback& on_chunk) {
    auto& client = session_.client();
    auto& governor = session_.governor();
    
    bool ranged = client.supports_ranged_fetch(descriptor.media_kind);
    if (start_offset > 0 && !ranged) {
        LOG_DEBUG("Item {}: {} has no ranged fetch, restarting from 0",
                  descriptor.id, to_string(descriptor.media_kind));
        start_offset = 0;
    }
    
    storage::PartialFileWriter writer(descriptor.destination_path,
                                      storage_.partial_path(descriptor.destination_path),
                                      static_cast<size_t>(profile_.buffer_size_bytes));
    
    FetchOutcome outcome;
    
    auto fail = [&](TransferResult error) {
        outcome.status = FetchStatus::FAILED;
        outcome.error = std::move(error);
        outcome.offset = writer.bytes_on_disk();
        return outcome;
    };
    
    // Flush what we have so a later dispatch resumes from it
    auto park = [&](FetchStatus status) {
        auto result = writer.park();
        if (!result) {
            return fail(result);
        }
        outcome.status = status;
        outcome.offset = writer.offset();
        return outcome;
    };
    
    auto size_mismatch = [&](const std::string& message) {
        auto result = writer.discard();
        if (!result) {
            LOG_ERROR("Item {}: {}", descriptor.id, result.message);
        }
        outcome.offset = 0;
        outcome.status = FetchStatus::FAILED;
        outcome.error = TransferResult(TransferError::SIZE_MISMATCH, message);
        return outcome;
    };
    
    auto opened = writer.open(start_offset);
    if (!opened) {
        return fail(opened);
    }
    
    BackoffPolicy backoff(profile_.max_chunk_retries, profile_.retry_base_delay, profile_.retry_max_delay);
    uint32_t attempt = 0;
    uint64_t chunk_size = std::max<uint64_t>(profile_.chunk_size_bytes, 1);
    uint64_t chunk_index = writer.offset() / chunk_size;
    int64_t reference_size = descriptor.expected_size;
    std::unique_ptr<remote::RemoteStream> stream;
    std::vector<uint8_t> chunk;
    chunk.reserve(static_cast<size_t>(chunk_size));
    
    // Drops the stream and backs off; an outcome means the fetch ends here
    auto retry_transient = [&](const std::string& message) -> std::optional<FetchOutcome> {
        stream.reset();
        attempt++;
        outcome.transient_retries++;
        if (backoff.exhausted(attempt)) {
            LOG_ERROR("Item {}: giving up after {} retries: {}", descriptor.id,
                      backoff.max_retries(), message);
            auto parked = writer.park();
            if (!parked) {
                return fail(parked);
            }
            return fail(TransferResult(TransferError::TRANSIENT_NETWORK, message));
        }
        
        auto delay = backoff.delay_for(attempt);
        LOG_WARN("Item {}: transient failure at offset {} ({}), retry {}/{} in {}ms",
                 descriptor.id, writer.offset(), message, attempt, backoff.max_retries(), delay.count());
        
        if (!cancel.wait_for(delay)) {
            return park(FetchStatus::CANCELLED);
        }
        
        if (!ranged && writer.offset() > 0) {
            auto restarted = writer.restart();
            if (!restarted) {
                return fail(restarted);
            }
            chunk_index = 0;
        }
        return std::nullopt;
    };
    
    while (true) {
        if (cancel.is_cancelled()) {
            LOG_DEBUG("Item {} cancelled at offset {}", descriptor.id, writer.offset());
            return park(FetchStatus::CANCELLED);
        }
        
        auto admission = governor.admit();
        if (!admission.permitted) {
            outcome.retry_after = admission.wait;
            outcome.rate_limited = false;
            return park(FetchStatus::RETRY_AFTER);
        }
        
        remote::RemoteResult result;
        bool opening = !stream;
        
        if (opening) {
            result = client.open_ranged_stream(descriptor.channel_ref, descriptor.id, writer.offset(), stream);
            if (result.success() && !stream) {
                result = remote::RemoteResult::transient("remote returned no stream");
            }
        } else {
            uint64_t request = chunk_size;
            if (reference_size >= 0) {
                auto size = static_cast<uint64_t>(reference_size);
                request = std::min<uint64_t>(request, size > writer.offset() ? size - writer.offset() : 1);
            }
            chunk.clear();
            result = stream->read(static_cast<size_t>(request), chunk);
        }
        
        switch (result.status) {
            case remote::RemoteStatus::OK:
                break;
                
            case remote::RemoteStatus::END_OF_DATA:
                if (opening) {
                    return fail(TransferResult(TransferError::REMOTE_FAILURE,
                                               "Remote has no data for item " + std::to_string(descriptor.id)));
                }
                if (reference_size >= 0 && writer.offset() != static_cast<uint64_t>(reference_size)) {
                    return size_mismatch("Remote ended item " + std::to_string(descriptor.id) + " at " +
                                         std::to_string(writer.offset()) + " of " +
                                         std::to_string(reference_size) + " bytes");
                }
                break;
                
            case remote::RemoteStatus::RATE_LIMITED:
                governor.on_flood_wait(result.retry_after, profile_.flood_wait_multiplier);
                stream.reset();
                outcome.retry_after = governor.remaining();
                outcome.rate_limited = true;
                return park(FetchStatus::RETRY_AFTER);
                
            case remote::RemoteStatus::TRANSIENT_FAILURE:
                if (auto stop = retry_transient(result.message)) {
                    return *stop;
                }
                continue;
                
            case remote::RemoteStatus::PERMANENT_FAILURE:
                stream.reset();
                return fail(TransferResult(TransferError::REMOTE_FAILURE, result.message));
        }
        
        if (result.status == remote::RemoteStatus::END_OF_DATA) {
            break;
        }
        
        if (opening) {
            auto reported = stream->reported_size();
            if (reported >= 0) {
                if (reference_size >= 0 && reported != reference_size) {
                    return size_mismatch("Remote reports " + std::to_string(reported) +
                                         " bytes for item " + std::to_string(descriptor.id) +
                                         ", expected " + std::to_string(reference_size));
                }
                reference_size = reported;
            }
            continue;
        }
        
        // A successful read must make progress
        if (chunk.empty()) {
            if (auto stop = retry_transient("remote returned an empty chunk")) {
                return *stop;
            }
            continue;
        }
        
        auto reported = stream->reported_size();
        if (reference_size >= 0 && reported >= 0 && reported != reference_size) {
            return size_mismatch("Remote size of item " + std::to_string(descriptor.id) +
                                 " changed from " + std::to_string(reference_size) +
                                 " to " + std::to_string(reported));
        }
        
        if (reference_size >= 0 && writer.offset() + chunk.size() > static_cast<uint64_t>(reference_size)) {
            return size_mismatch("Remote sent more than " + std::to_string(reference_size) +
                                 " bytes for item " + std::to_string(descriptor.id));
        }
        
        auto written = writer.append(chunk);
        if (!written) {
            return fail(written);
        }
        
        attempt = 0;
        governor.on_chunk_success();
        chunk_index++;
        
        if (on_chunk) {
            on_chunk(writer.offset(), chunk_index);
        }
        
        if (reference_size >= 0 && writer.offset() == static_cast<uint64_t>(reference_size)) {
            break;
        }
    }
    
    auto committed = writer.commit();
    if (!committed) {
        return fail(committed);
    }
    
    outcome.status = FetchStatus::COMPLETED;
    outcome.offset = writer.offset();
    
    if (storage_.verify_digest) {
        auto digested = crypto::FileDigest::hash_file(descriptor.destination_path, outcome.digest);
        if (!digested) {
            LOG_WARN("Item {}: digest failed: {}", descriptor.id, digested.message);
        } else {
            LOG_DEBUG("Item {}: blake2b {}", descriptor.id, outcome.digest);
        }
    }
    
    return outcome;
}

} // namespace mediaferry::transfer
