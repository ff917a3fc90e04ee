#include <gtest/gtest.h>
#include <orbitguard/orbitguard.hpp>

using namespace orbitguard;
using namespace std::chrono_literals;

class TokenBucketTest : public ::testing::Test {
protected:
    Timestamp t0 = Clock::now();
};

TEST_F(TokenBucketTest, StartsFull) {
    TokenBucket bucket(100.0, 50.0, t0);
    EXPECT_DOUBLE_EQ(bucket.tokens_available(t0), 50.0);
    EXPECT_DOUBLE_EQ(bucket.utilization(t0), 0.0);
    EXPECT_DOUBLE_EQ(bucket.rate(), 100.0);
    EXPECT_DOUBLE_EQ(bucket.burst(), 50.0);
}

TEST_F(TokenBucketTest, AcquireDebitsAndFailsWhenShort) {
    TokenBucket bucket(100.0, 50.0, t0);
    EXPECT_TRUE(bucket.acquire(30.0, t0));
    EXPECT_DOUBLE_EQ(bucket.tokens_available(t0), 20.0);

    EXPECT_FALSE(bucket.acquire(30.0, t0));
    EXPECT_DOUBLE_EQ(bucket.tokens_available(t0), 20.0);
}

TEST_F(TokenBucketTest, RefillsWithElapsedTime) {
    TokenBucket bucket(100.0, 50.0, t0);
    ASSERT_TRUE(bucket.acquire(50.0, t0));
    EXPECT_DOUBLE_EQ(bucket.utilization(t0), 1.0);

    EXPECT_NEAR(bucket.tokens_available(t0 + 250ms), 25.0, 1e-9);
    EXPECT_TRUE(bucket.acquire(25.0, t0 + 250ms));
}

TEST_F(TokenBucketTest, RefillNeverExceedsBurst) {
    TokenBucket bucket(100.0, 50.0, t0);
    ASSERT_TRUE(bucket.acquire(10.0, t0));
    EXPECT_DOUBLE_EQ(bucket.tokens_available(t0 + 10s), 50.0);
}

TEST_F(TokenBucketTest, TimeGoingBackwardsIsIgnored) {
    TokenBucket bucket(100.0, 50.0, t0);
    ASSERT_TRUE(bucket.acquire(40.0, t0 + 1s));
    EXPECT_DOUBLE_EQ(bucket.tokens_available(t0), 10.0);
}

TEST_F(TokenBucketTest, RefundClampsToBurst) {
    TokenBucket bucket(100.0, 50.0, t0);
    ASSERT_TRUE(bucket.acquire(20.0, t0));
    bucket.refund(20.0);
    EXPECT_DOUBLE_EQ(bucket.tokens_available(t0), 50.0);

    bucket.refund(100.0);
    EXPECT_DOUBLE_EQ(bucket.tokens_available(t0), 50.0);
}

TEST_F(TokenBucketTest, UtilizationTracksFillLevel) {
    TokenBucket bucket(100.0, 200.0, t0);
    ASSERT_TRUE(bucket.acquire(150.0, t0));
    EXPECT_DOUBLE_EQ(bucket.utilization(t0), 0.75);
}
