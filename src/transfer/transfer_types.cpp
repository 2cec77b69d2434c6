#include "mediaferry/transfer/transfer_types.hpp"
#include "mediaferry/core/utils.hpp"

namespace mediaferry::transfer {

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "success";
        case TransferError::RATE_LIMITED: return "rate_limited";
        case TransferError::TRANSIENT_NETWORK: return "transient_network";
        case TransferError::DESTINATION_WRITE: return "destination_write";
        case TransferError::SIZE_MISMATCH: return "size_mismatch";
        case TransferError::CANCELLED: return "cancelled";
        case TransferError::REMOTE_FAILURE: return "remote_failure";
        case TransferError::INVALID_DESCRIPTOR: return "invalid_descriptor";
        case TransferError::INVALID_PROFILE: return "invalid_profile";
        case TransferError::INVALID_STATE: return "invalid_state";
        case TransferError::NOT_FOUND: return "not_found";
    }
    return "unknown";
}

const char* to_string(MediaKind kind) {
    switch (kind) {
        case MediaKind::AUDIO: return "audio";
        case MediaKind::VIDEO: return "video";
        case MediaKind::PHOTO: return "photo";
        case MediaKind::DOCUMENT: return "document";
        case MediaKind::VOICE: return "voice";
        case MediaKind::VIDEO_NOTE: return "video_note";
        case MediaKind::ANIMATION: return "animation";
        case MediaKind::STICKER: return "sticker";
    }
    return "document";
}

std::optional<MediaKind> parse_media_kind(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(core::utils::StringUtils::trim(name));
    
    if (lower == "audio") return MediaKind::AUDIO;
    if (lower == "video") return MediaKind::VIDEO;
    if (lower == "photo") return MediaKind::PHOTO;
    if (lower == "document") return MediaKind::DOCUMENT;
    if (lower == "voice") return MediaKind::VOICE;
    if (lower == "video_note" || lower == "video-note") return MediaKind::VIDEO_NOTE;
    if (lower == "animation" || lower == "gif") return MediaKind::ANIMATION;
    if (lower == "sticker") return MediaKind::STICKER;
    
    return std::nullopt;
}

const char* default_extension(MediaKind kind) {
    switch (kind) {
        case MediaKind::AUDIO: return ".mp3";
        case MediaKind::VIDEO: return ".mp4";
        case MediaKind::PHOTO: return ".jpg";
        case MediaKind::DOCUMENT: return ".bin";
        case MediaKind::VOICE: return ".ogg";
        case MediaKind::VIDEO_NOTE: return ".mp4";
        case MediaKind::ANIMATION: return ".gif";
        case MediaKind::STICKER: return ".webp";
    }
    return ".bin";
}

std::string default_file_name(MediaKind kind, int64_t item_id) {
    return std::string(to_string(kind)) + "_" + std::to_string(item_id) + default_extension(kind);
}

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::QUEUED: return "queued";
        case TransferStatus::RESUMING: return "resuming";
        case TransferStatus::IN_PROGRESS: return "in_progress";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::SKIPPED: return "skipped";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::SKIPPED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

bool is_valid_transition(TransferStatus from, TransferStatus to) {
    if (is_terminal(from)) {
        return false;
    }
    
    if (to == TransferStatus::CANCELLED) {
        return true;
    }
    
    switch (from) {
        case TransferStatus::QUEUED:
            return to == TransferStatus::RESUMING ||
                   to == TransferStatus::IN_PROGRESS ||
                   to == TransferStatus::SKIPPED;
        case TransferStatus::RESUMING:
            return to == TransferStatus::IN_PROGRESS ||
                   to == TransferStatus::QUEUED;
        case TransferStatus::IN_PROGRESS:
            return to == TransferStatus::COMPLETED ||
                   to == TransferStatus::FAILED ||
                   to == TransferStatus::QUEUED;
        default:
            return false;
    }
}

} // namespace mediaferry::transfer
