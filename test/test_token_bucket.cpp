#include "utils/token_bucket.hpp"
#include <gtest/gtest.h>

using namespace parley;

TEST(TokenBucketTest, BurstThenRefill) {
    TokenBucket bucket(60, 3, 1000);

    EXPECT_TRUE(bucket.try_take(1000));
    EXPECT_TRUE(bucket.try_take(1000));
    EXPECT_TRUE(bucket.try_take(1000));
    EXPECT_FALSE(bucket.try_take(1000));
    EXPECT_FALSE(bucket.try_take(1999));

    // One token per second
    EXPECT_TRUE(bucket.try_take(2000));
    EXPECT_FALSE(bucket.try_take(2000));
    EXPECT_EQ(bucket.rejected(), 3u);
}

TEST(TokenBucketTest, RefillStopsAtBurst) {
    TokenBucket bucket(600, 2, 0);
    EXPECT_TRUE(bucket.try_take(0));
    EXPECT_TRUE(bucket.try_take(0));

    // Ten minutes idle still leaves only two tokens
    EXPECT_TRUE(bucket.try_take(600000));
    EXPECT_TRUE(bucket.try_take(600000));
    EXPECT_FALSE(bucket.try_take(600000));
}

TEST(TokenBucketTest, PartialIntervalsAccumulate) {
    TokenBucket bucket(1200, 1, 0);
    EXPECT_TRUE(bucket.try_take(0));

    // 50 ms per token, reached over several calls
    EXPECT_FALSE(bucket.try_take(20));
    EXPECT_FALSE(bucket.try_take(40));
    EXPECT_TRUE(bucket.try_take(50));
}

TEST(TokenBucketTest, ClockGoingBackwardsAddsNothing) {
    TokenBucket bucket(60, 1, 5000);
    EXPECT_TRUE(bucket.try_take(5000));
    EXPECT_FALSE(bucket.try_take(4000));
    EXPECT_FALSE(bucket.try_take(5500));
    EXPECT_TRUE(bucket.try_take(6000));
}

TEST(TokenBucketTest, ZeroRateNeverLimits) {
    TokenBucket bucket;
    EXPECT_FALSE(bucket.enabled());
    for (int i = 0; i < 100; i++) {
        EXPECT_TRUE(bucket.try_take(0));
    }
    EXPECT_EQ(bucket.rejected(), 0u);
}
