#pragma once

#include "transfer_error.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mediaferry::transfer {

enum class MediaKind {
    AUDIO,
    VIDEO,
    PHOTO,
    DOCUMENT,
    VOICE,
    VIDEO_NOTE,
    ANIMATION,
    STICKER
};

const char* to_string(MediaKind kind);
std::optional<MediaKind> parse_media_kind(const std::string& name);

// Extension used when the remote item carries no file name of its own
const char* default_extension(MediaKind kind);

// "<kind>_<id><ext>", e.g. audio_2436.mp3
std::string default_file_name(MediaKind kind, int64_t item_id);

constexpr int64_t UNKNOWN_SIZE = -1;

// One unit of work; never mutated once handed to the scheduler
struct TransferDescriptor {
    int64_t id = 0;
    MediaKind media_kind = MediaKind::DOCUMENT;
    std::filesystem::path destination_path;
    int64_t expected_size = UNKNOWN_SIZE;
    std::string channel_ref;
    std::string session_ref;
    
    bool has_known_size() const { return expected_size >= 0; }
};

enum class TransferStatus {
    QUEUED,
    RESUMING,
    IN_PROGRESS,
    COMPLETED,
    SKIPPED,
    FAILED,
    CANCELLED
};

const char* to_string(TransferStatus status);

bool is_terminal(TransferStatus status);

// Whether the scheduler may move a descriptor from `from` to `to`.
// Terminal states are final. An active descriptor (RESUMING or IN_PROGRESS)
// may fall back to QUEUED when its worker parks on a session cooldown and
// gives the slot back.
bool is_valid_transition(TransferStatus from, TransferStatus to);

struct TransferState {
    int64_t descriptor_id = 0;
    TransferStatus status = TransferStatus::QUEUED;
    uint64_t bytes_transferred = 0;
    uint64_t chunk_index = 0;
    uint32_t retry_count = 0;
    std::optional<TransferResult> last_error;
    std::string digest;
};

} // namespace mediaferry::transfer
