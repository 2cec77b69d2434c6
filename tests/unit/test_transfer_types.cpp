#include <gtest/gtest.h>
#include "mediaferry/transfer/transfer_types.hpp"

using namespace mediaferry::transfer;

TEST(TransferTypesTest, MediaKindNames) {
    EXPECT_STREQ(to_string(MediaKind::VIDEO_NOTE), "video_note");
    
    EXPECT_EQ(parse_media_kind("Audio"), MediaKind::AUDIO);
    EXPECT_EQ(parse_media_kind("video-note"), MediaKind::VIDEO_NOTE);
    EXPECT_EQ(parse_media_kind("gif"), MediaKind::ANIMATION);
    EXPECT_EQ(parse_media_kind(" sticker "), MediaKind::STICKER);
    EXPECT_FALSE(parse_media_kind("podcast").has_value());
}

TEST(TransferTypesTest, DefaultFileName) {
    EXPECT_EQ(default_file_name(MediaKind::AUDIO, 2436), "audio_2436.mp3");
    EXPECT_EQ(default_file_name(MediaKind::VOICE, 7), "voice_7.ogg");
    EXPECT_EQ(default_file_name(MediaKind::STICKER, 99), "sticker_99.webp");
    EXPECT_EQ(default_file_name(MediaKind::DOCUMENT, 1), "document_1.bin");
}

TEST(TransferTypesTest, DescriptorKnownSize) {
    TransferDescriptor descriptor;
    EXPECT_FALSE(descriptor.has_known_size());
    
    descriptor.expected_size = 0;
    EXPECT_TRUE(descriptor.has_known_size());
}

TEST(TransferTypesTest, TerminalStatuses) {
    EXPECT_FALSE(is_terminal(TransferStatus::QUEUED));
    EXPECT_FALSE(is_terminal(TransferStatus::RESUMING));
    EXPECT_FALSE(is_terminal(TransferStatus::IN_PROGRESS));
    EXPECT_TRUE(is_terminal(TransferStatus::COMPLETED));
    EXPECT_TRUE(is_terminal(TransferStatus::SKIPPED));
    EXPECT_TRUE(is_terminal(TransferStatus::FAILED));
    EXPECT_TRUE(is_terminal(TransferStatus::CANCELLED));
}

TEST(TransferTypesTest, ForwardTransitions) {
    EXPECT_TRUE(is_valid_transition(TransferStatus::QUEUED, TransferStatus::IN_PROGRESS));
    EXPECT_TRUE(is_valid_transition(TransferStatus::QUEUED, TransferStatus::RESUMING));
    EXPECT_TRUE(is_valid_transition(TransferStatus::QUEUED, TransferStatus::SKIPPED));
    EXPECT_TRUE(is_valid_transition(TransferStatus::RESUMING, TransferStatus::IN_PROGRESS));
    EXPECT_TRUE(is_valid_transition(TransferStatus::IN_PROGRESS, TransferStatus::COMPLETED));
    EXPECT_TRUE(is_valid_transition(TransferStatus::IN_PROGRESS, TransferStatus::FAILED));
}

TEST(TransferTypesTest, ParkingReturnsToQueue) {
    EXPECT_TRUE(is_valid_transition(TransferStatus::IN_PROGRESS, TransferStatus::QUEUED));
    EXPECT_TRUE(is_valid_transition(TransferStatus::RESUMING, TransferStatus::QUEUED));
}

TEST(TransferTypesTest, AnyNonTerminalCanBeCancelled) {
    EXPECT_TRUE(is_valid_transition(TransferStatus::QUEUED, TransferStatus::CANCELLED));
    EXPECT_TRUE(is_valid_transition(TransferStatus::RESUMING, TransferStatus::CANCELLED));
    EXPECT_TRUE(is_valid_transition(TransferStatus::IN_PROGRESS, TransferStatus::CANCELLED));
}

TEST(TransferTypesTest, TerminalStatusesAreFinal) {
    const TransferStatus all[] = {
        TransferStatus::QUEUED, TransferStatus::RESUMING, TransferStatus::IN_PROGRESS,
        TransferStatus::COMPLETED, TransferStatus::SKIPPED, TransferStatus::FAILED,
        TransferStatus::CANCELLED
    };
    
    for (auto from : all) {
        if (!is_terminal(from)) continue;
        for (auto to : all) {
            EXPECT_FALSE(is_valid_transition(from, to))
                << to_string(from) << " -> " << to_string(to);
        }
    }
}

TEST(TransferTypesTest, SkipOnlyFromQueued) {
    EXPECT_FALSE(is_valid_transition(TransferStatus::IN_PROGRESS, TransferStatus::SKIPPED));
    EXPECT_FALSE(is_valid_transition(TransferStatus::RESUMING, TransferStatus::COMPLETED));
    EXPECT_FALSE(is_valid_transition(TransferStatus::QUEUED, TransferStatus::COMPLETED));
}

TEST(TransferTypesTest, FailureOnlyFromInProgress) {
    EXPECT_FALSE(is_valid_transition(TransferStatus::QUEUED, TransferStatus::FAILED));
    EXPECT_FALSE(is_valid_transition(TransferStatus::RESUMING, TransferStatus::FAILED));
    EXPECT_TRUE(is_valid_transition(TransferStatus::IN_PROGRESS, TransferStatus::FAILED));
}

TEST(TransferTypesTest, TransferResult) {
    TransferResult ok;
    EXPECT_TRUE(ok.success());
    EXPECT_TRUE(ok);
    
    TransferResult failed(TransferError::SIZE_MISMATCH, "remote grew");
    EXPECT_FALSE(failed);
    EXPECT_STREQ(to_string(failed.error), "size_mismatch");
    EXPECT_EQ(failed.message, "remote grew");
}
