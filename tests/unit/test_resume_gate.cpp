#include <gtest/gtest.h>
#include "mediaferry/storage/resume_gate.hpp"
#include "mediaferry/core/utils.hpp"
#include <filesystem>
#include <limits>

using namespace mediaferry::storage;
using namespace mediaferry::transfer;
using mediaferry::core::utils::FileUtils;

class ResumeGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "mediaferry_gate_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        
        config_.check_free_space = false;
    }
    
    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }
    
    TransferDescriptor make_descriptor(int64_t expected_size, const std::string& name = "video_1.mp4") {
        TransferDescriptor descriptor;
        descriptor.id = 1;
        descriptor.media_kind = MediaKind::VIDEO;
        descriptor.destination_path = test_dir_ / name;
        descriptor.expected_size = expected_size;
        descriptor.channel_ref = "channel";
        return descriptor;
    }
    
    void write_bytes(const std::filesystem::path& path, size_t size) {
        FileUtils::write_file(path, std::string(size, 'm'));
    }
    
    std::filesystem::path test_dir_;
    StorageConfig config_;
};

TEST_F(ResumeGateTest, NothingOnDiskStartsFresh) {
    ResumeGate gate(config_);
    auto decision = gate.evaluate(make_descriptor(1000), true);
    
    EXPECT_EQ(decision.verdict, GateVerdict::FRESH);
    EXPECT_EQ(decision.start_offset, 0u);
}

TEST_F(ResumeGateTest, CompleteFileIsSkipped) {
    auto descriptor = make_descriptor(1000);
    write_bytes(descriptor.destination_path, 1000);
    
    ResumeGate gate(config_);
    EXPECT_EQ(gate.evaluate(descriptor, true).verdict, GateVerdict::SKIP);
    EXPECT_EQ(*FileUtils::file_size(descriptor.destination_path), 1000u);
}

TEST_F(ResumeGateTest, LargerFileIsSkipped) {
    auto descriptor = make_descriptor(1000);
    write_bytes(descriptor.destination_path, 1200);
    
    ResumeGate gate(config_);
    EXPECT_EQ(gate.evaluate(descriptor, true).verdict, GateVerdict::SKIP);
}

TEST_F(ResumeGateTest, ShortFinalFileIsFetchedAgain) {
    auto descriptor = make_descriptor(1000);
    write_bytes(descriptor.destination_path, 10);
    
    ResumeGate gate(config_);
    EXPECT_EQ(gate.evaluate(descriptor, true).verdict, GateVerdict::FRESH);
}

TEST_F(ResumeGateTest, UnknownSizeExistingFileIsSkipped) {
    auto descriptor = make_descriptor(UNKNOWN_SIZE);
    write_bytes(descriptor.destination_path, 1);
    
    ResumeGate gate(config_);
    EXPECT_EQ(gate.evaluate(descriptor, true).verdict, GateVerdict::SKIP);
}

TEST_F(ResumeGateTest, UnknownSizeDiscardsPartial) {
    auto descriptor = make_descriptor(UNKNOWN_SIZE);
    ResumeGate gate(config_);
    write_bytes(gate.partial_path(descriptor), 300);
    
    auto decision = gate.evaluate(descriptor, true);
    EXPECT_EQ(decision.verdict, GateVerdict::FRESH);
    EXPECT_FALSE(std::filesystem::exists(gate.partial_path(descriptor)));
}

TEST_F(ResumeGateTest, PartialResumesAtItsLength) {
    auto descriptor = make_descriptor(1000);
    ResumeGate gate(config_);
    write_bytes(gate.partial_path(descriptor), 400);
    
    auto decision = gate.evaluate(descriptor, true);
    EXPECT_EQ(decision.verdict, GateVerdict::RESUME);
    EXPECT_EQ(decision.start_offset, 400u);
}

TEST_F(ResumeGateTest, PartialRestartsWithoutRangedFetch) {
    auto descriptor = make_descriptor(1000);
    ResumeGate gate(config_);
    write_bytes(gate.partial_path(descriptor), 400);
    
    auto decision = gate.evaluate(descriptor, false);
    EXPECT_EQ(decision.verdict, GateVerdict::FRESH);
    EXPECT_EQ(decision.start_offset, 0u);
    EXPECT_FALSE(std::filesystem::exists(gate.partial_path(descriptor)));
}

TEST_F(ResumeGateTest, EmptyPartialStartsFresh) {
    auto descriptor = make_descriptor(1000);
    ResumeGate gate(config_);
    write_bytes(gate.partial_path(descriptor), 0);
    
    EXPECT_EQ(gate.evaluate(descriptor, true).verdict, GateVerdict::FRESH);
}

TEST_F(ResumeGateTest, CompletePartialIsFinalized) {
    auto descriptor = make_descriptor(1000);
    ResumeGate gate(config_);
    write_bytes(gate.partial_path(descriptor), 1000);
    
    auto decision = gate.evaluate(descriptor, true);
    EXPECT_EQ(decision.verdict, GateVerdict::SKIP);
    EXPECT_FALSE(std::filesystem::exists(gate.partial_path(descriptor)));
    EXPECT_EQ(*FileUtils::file_size(descriptor.destination_path), 1000u);
}

TEST_F(ResumeGateTest, OversizedPartialIsDiscarded) {
    auto descriptor = make_descriptor(1000);
    ResumeGate gate(config_);
    write_bytes(gate.partial_path(descriptor), 1500);
    
    auto decision = gate.evaluate(descriptor, true);
    EXPECT_EQ(decision.verdict, GateVerdict::FRESH);
    EXPECT_FALSE(std::filesystem::exists(gate.partial_path(descriptor)));
}

TEST_F(ResumeGateTest, CreatesDestinationDirectories) {
    auto descriptor = make_descriptor(10, "nested/deeper/voice_1.ogg");
    
    ResumeGate gate(config_);
    EXPECT_EQ(gate.evaluate(descriptor, true).verdict, GateVerdict::FRESH);
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "nested" / "deeper"));
}

TEST_F(ResumeGateTest, DirectoryAtDestinationIsRejected) {
    auto descriptor = make_descriptor(10, "taken");
    std::filesystem::create_directories(descriptor.destination_path);
    
    ResumeGate gate(config_);
    auto decision = gate.evaluate(descriptor, true);
    EXPECT_EQ(decision.verdict, GateVerdict::REJECT);
    EXPECT_EQ(decision.error.error, TransferError::DESTINATION_WRITE);
}

TEST_F(ResumeGateTest, InsufficientSpaceIsRejected) {
    config_.check_free_space = true;
    auto descriptor = make_descriptor(std::numeric_limits<int64_t>::max());
    
    ResumeGate gate(config_);
    auto decision = gate.evaluate(descriptor, true);
    EXPECT_EQ(decision.verdict, GateVerdict::REJECT);
}

TEST_F(ResumeGateTest, CustomPartialSuffix) {
    config_.partial_suffix = ".incomplete";
    ResumeGate gate(config_);
    
    auto descriptor = make_descriptor(10);
    EXPECT_EQ(gate.partial_path(descriptor), test_dir_ / "video_1.mp4.incomplete");
}
