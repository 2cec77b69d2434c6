#include <gtest/gtest.h>
#include "mediaferry/transfer/rate_governor.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace mediaferry::transfer;
using std::chrono::milliseconds;

TEST(RateGovernorTest, OpenByDefault) {
    RateGovernor governor;
    
    auto admission = governor.admit();
    EXPECT_TRUE(admission.permitted);
    EXPECT_EQ(admission.wait.count(), 0);
    EXPECT_FALSE(governor.is_blocked());
    EXPECT_FALSE(governor.blocked_until().has_value());
}

TEST(RateGovernorTest, FloodWaitBlocksWithMultiplier) {
    RateGovernor governor;
    
    auto before = RateGovernor::Clock::now();
    auto deadline = governor.on_flood_wait(milliseconds(1000), 1.5);
    
    EXPECT_GE(deadline, before + milliseconds(1500));
    EXPECT_TRUE(governor.is_blocked());
    
    auto admission = governor.admit();
    EXPECT_FALSE(admission.permitted);
    EXPECT_GT(admission.wait.count(), 1000);
    EXPECT_LE(admission.wait.count(), 1500);
    EXPECT_EQ(governor.consecutive_flood_waits(), 1u);
}

TEST(RateGovernorTest, MultiplierBelowOneIsIgnored) {
    RateGovernor governor;
    
    governor.on_flood_wait(milliseconds(200), 0.1);
    EXPECT_GT(governor.remaining().count(), 150);
}

TEST(RateGovernorTest, ReopensAfterCooldown) {
    RateGovernor governor;
    
    governor.on_flood_wait(milliseconds(30), 1.0);
    EXPECT_FALSE(governor.admit().permitted);
    
    std::this_thread::sleep_for(governor.remaining() + milliseconds(5));
    
    EXPECT_TRUE(governor.admit().permitted);
    EXPECT_FALSE(governor.blocked_until().has_value());
}

TEST(RateGovernorTest, LongerCooldownWins) {
    RateGovernor governor;
    
    auto long_deadline = governor.on_flood_wait(milliseconds(2000), 1.0);
    auto after_short = governor.on_flood_wait(milliseconds(100), 1.0);
    
    EXPECT_EQ(after_short, long_deadline);
    EXPECT_GT(governor.remaining().count(), 1500);
    EXPECT_EQ(governor.consecutive_flood_waits(), 2u);
    
    auto longer = governor.on_flood_wait(milliseconds(5000), 1.0);
    EXPECT_GT(longer, long_deadline);
}

TEST(RateGovernorTest, ChunkSuccessResetsConsecutiveCount) {
    RateGovernor governor;
    
    governor.on_flood_wait(milliseconds(1), 1.0);
    governor.on_flood_wait(milliseconds(1), 1.0);
    EXPECT_EQ(governor.consecutive_flood_waits(), 2u);
    
    governor.on_chunk_success();
    EXPECT_EQ(governor.consecutive_flood_waits(), 0u);
    EXPECT_EQ(governor.total_flood_waits(), 2u);
}

TEST(RateGovernorTest, ResetClearsBlock) {
    RateGovernor governor;
    
    governor.on_flood_wait(milliseconds(10000), 2.0);
    governor.reset();
    
    EXPECT_TRUE(governor.admit().permitted);
    EXPECT_EQ(governor.consecutive_flood_waits(), 0u);
}

TEST(RateGovernorTest, ConcurrentFloodWaitsKeepLongest) {
    RateGovernor governor;
    std::vector<std::thread> threads;
    
    for (int i = 1; i <= 8; ++i) {
        threads.emplace_back([&governor, i] {
            governor.on_flood_wait(milliseconds(i * 100), 1.0);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    EXPECT_EQ(governor.total_flood_waits(), 8u);
    EXPECT_GT(governor.remaining().count(), 700);
}
