#include <gtest/gtest.h>
#include "mediaferry/transfer/performance_profile.hpp"
#include "mediaferry/core/config.hpp"

using namespace mediaferry::transfer;
using mediaferry::core::Config;

TEST(PerformanceProfileTest, PresetValues) {
    auto conservative = PerformanceProfile::conservative();
    EXPECT_EQ(conservative.max_concurrent, 1u);
    EXPECT_EQ(conservative.chunk_size_bytes, 256u * 1024);
    EXPECT_EQ(conservative.inter_file_delay.count(), 1000);
    EXPECT_DOUBLE_EQ(conservative.flood_wait_multiplier, 2.0);
    
    auto balanced = PerformanceProfile::balanced();
    EXPECT_EQ(balanced.max_concurrent, 3u);
    EXPECT_EQ(balanced.chunk_size_bytes, 512u * 1024);
    EXPECT_EQ(balanced.inter_file_delay.count(), 300);
    EXPECT_DOUBLE_EQ(balanced.flood_wait_multiplier, 1.5);
    
    auto aggressive = PerformanceProfile::aggressive();
    EXPECT_EQ(aggressive.max_concurrent, 5u);
    EXPECT_EQ(aggressive.chunk_size_bytes, 1024u * 1024);
    
    auto maximum = PerformanceProfile::maximum();
    EXPECT_EQ(maximum.max_concurrent, 8u);
    EXPECT_EQ(maximum.chunk_size_bytes, 2048u * 1024);
    EXPECT_EQ(maximum.inter_file_delay.count(), 50);
    EXPECT_DOUBLE_EQ(maximum.flood_wait_multiplier, 1.0);
    
    for (const auto& preset : PerformanceProfile::presets()) {
        EXPECT_TRUE(preset.validate()) << preset.describe();
        EXPECT_EQ(preset.buffer_size_bytes, 1024u * 1024);
    }
}

TEST(PerformanceProfileTest, FromName) {
    EXPECT_EQ(PerformanceProfile::from_name("Aggressive").preset, ProfilePreset::AGGRESSIVE);
    EXPECT_EQ(PerformanceProfile::from_name(" MAXIMUM ").preset, ProfilePreset::MAXIMUM);
    EXPECT_EQ(PerformanceProfile::from_name("ludicrous").preset, ProfilePreset::BALANCED);
}

TEST(PerformanceProfileTest, FromConfigUsesPreset) {
    Config config;
    config.set("profile.preset", "conservative");
    
    auto profile = PerformanceProfile::from_config(config);
    EXPECT_EQ(profile.preset, ProfilePreset::CONSERVATIVE);
    EXPECT_EQ(profile.max_concurrent, 1u);
}

TEST(PerformanceProfileTest, FromConfigOverridesMakeCustomProfile) {
    Config config;
    config.set("profile.preset", "aggressive");
    config.set("profile.max_concurrent", "2");
    config.set("profile.chunk_size_kb", "128");
    config.set("profile.inter_file_delay_ms", "25");
    config.set("profile.flood_wait_multiplier", "1.75");
    config.set("profile.max_rate_limit_retries", "6");
    
    auto profile = PerformanceProfile::from_config(config);
    EXPECT_EQ(profile.preset, ProfilePreset::CUSTOM);
    EXPECT_EQ(profile.max_concurrent, 2u);
    EXPECT_EQ(profile.chunk_size_bytes, 128u * 1024);
    EXPECT_EQ(profile.buffer_size_bytes, 1024u * 1024);
    EXPECT_EQ(profile.inter_file_delay.count(), 25);
    EXPECT_DOUBLE_EQ(profile.flood_wait_multiplier, 1.75);
    EXPECT_EQ(profile.max_rate_limit_retries, 6u);
}

TEST(PerformanceProfileTest, ValidateRejectsBadValues) {
    auto profile = PerformanceProfile::balanced();
    profile.max_concurrent = 0;
    EXPECT_EQ(profile.validate().error, TransferError::INVALID_PROFILE);
    
    profile = PerformanceProfile::balanced();
    profile.chunk_size_bytes = 0;
    EXPECT_FALSE(profile.validate());
    
    profile = PerformanceProfile::balanced();
    profile.chunk_size_bytes = PerformanceProfile::MAX_CHUNK_SIZE + 1;
    EXPECT_FALSE(profile.validate());
    
    profile = PerformanceProfile::balanced();
    profile.buffer_size_bytes = 0;
    EXPECT_FALSE(profile.validate());
    
    profile = PerformanceProfile::balanced();
    profile.inter_file_delay = std::chrono::milliseconds(-1);
    EXPECT_FALSE(profile.validate());
    
    profile = PerformanceProfile::balanced();
    profile.flood_wait_multiplier = 0.5;
    EXPECT_FALSE(profile.validate());
}

TEST(PerformanceProfileTest, Describe) {
    auto text = PerformanceProfile::balanced().describe();
    EXPECT_NE(text.find("balanced"), std::string::npos);
    EXPECT_NE(text.find("concurrent=3"), std::string::npos);
    EXPECT_NE(text.find("512.00 KB"), std::string::npos);
}
