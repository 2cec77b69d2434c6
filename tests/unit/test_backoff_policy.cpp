#include <gtest/gtest.h>
#include "mediaferry/transfer/backoff_policy.hpp"

using namespace mediaferry::transfer;
using std::chrono::milliseconds;

TEST(BackoffPolicyTest, DoublesFromBase) {
    BackoffPolicy backoff(5, milliseconds(1000), milliseconds(30000));
    
    EXPECT_EQ(backoff.delay_for(1), milliseconds(1000));
    EXPECT_EQ(backoff.delay_for(2), milliseconds(2000));
    EXPECT_EQ(backoff.delay_for(3), milliseconds(4000));
    EXPECT_EQ(backoff.delay_for(5), milliseconds(16000));
}

TEST(BackoffPolicyTest, CappedAtMaxDelay) {
    BackoffPolicy backoff(50, milliseconds(1000), milliseconds(30000));
    
    EXPECT_EQ(backoff.delay_for(6), milliseconds(30000));
    EXPECT_EQ(backoff.delay_for(50), milliseconds(30000));
}

TEST(BackoffPolicyTest, Exhaustion) {
    BackoffPolicy backoff(3, milliseconds(10), milliseconds(100));
    
    EXPECT_FALSE(backoff.exhausted(1));
    EXPECT_FALSE(backoff.exhausted(3));
    EXPECT_TRUE(backoff.exhausted(4));
    
    BackoffPolicy no_retries(0, milliseconds(10), milliseconds(100));
    EXPECT_TRUE(no_retries.exhausted(1));
}
