#include <gtest/gtest.h>
#include <chrono>
#include <set>
#include <tuple>
#include <cstdint>
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

using zlease::ExponentialBackoff;
using zlease::RetryPolicy;

class ExponentialBackoffTest : public ::testing::Test {
protected:
    RetryPolicy defaultPolicy{
        std::chrono::microseconds{100L},
        std::chrono::microseconds{1000L},
        5,
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{200L}
    };
};

TEST_F(ExponentialBackoffTest, DelaysStayUnderTheDoublingCeiling) {
    ExponentialBackoff backoff(defaultPolicy);
    for (int i = 0; i < defaultPolicy.failureThreshold - 1; ++i) {
        auto delay = backoff.nextDelay();
        ASSERT_TRUE(delay.has_value());
        EXPECT_GE(delay.value(), std::chrono::microseconds{0L});
        EXPECT_LE(delay.value(), std::chrono::microseconds{100L << i});
    }
}

TEST_F(ExponentialBackoffTest, DelaysAreSpreadAcrossTheRange) {
    const RetryPolicy policy{
        std::chrono::microseconds{10L},
        std::chrono::microseconds{10L},
        1000,
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    std::set<int64_t> seen;
    for (int i = 0; i < policy.failureThreshold - 1; ++i) {
        seen.insert(backoff.nextDelay().value().count());
    }
    EXPECT_GE(seen.size(), 8);
    EXPECT_LE(*seen.rbegin(), 10);
}

TEST_F(ExponentialBackoffTest, DelayIsBoundedByRpcTimeout) {
    const RetryPolicy policy{
        std::chrono::microseconds{1000L},
        std::chrono::microseconds{60000000L},
        30,
        std::chrono::milliseconds{3L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    for (int i = 0; i < policy.failureThreshold - 1; ++i) {
        auto delay = backoff.nextDelay();
        ASSERT_TRUE(delay.has_value());
        EXPECT_LE(delay.value(), std::chrono::microseconds{3000L});
    }
}

TEST_F(ExponentialBackoffTest, ReturnsNulloptAfterThreshold) {
    ExponentialBackoff backoff(defaultPolicy);
    for (int i = 0; i < defaultPolicy.failureThreshold - 1; ++i) {
        ASSERT_TRUE(backoff.nextDelay().has_value());
    }
    EXPECT_EQ(backoff.attempts(), defaultPolicy.failureThreshold - 1);
    EXPECT_FALSE(backoff.nextDelay().has_value());
    EXPECT_EQ(backoff.attempts(), defaultPolicy.failureThreshold - 1);
}

TEST_F(ExponentialBackoffTest, ResetRestartsAttempts) {
    ExponentialBackoff backoff(defaultPolicy);
    for (int i = 0; i < defaultPolicy.failureThreshold; ++i) {
        std::ignore = backoff.nextDelay();
    }
    EXPECT_FALSE(backoff.nextDelay().has_value());
    backoff.reset();
    EXPECT_EQ(backoff.attempts(), 0);
    auto delay = backoff.nextDelay();
    ASSERT_TRUE(delay.has_value());
    EXPECT_LE(delay.value(), std::chrono::microseconds{100L});
}

TEST_F(ExponentialBackoffTest, ZeroThresholdReturnsNulloptImmediately) {
    const RetryPolicy policy{
        std::chrono::microseconds{100L},
        std::chrono::microseconds{1000L},
        0,
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    EXPECT_FALSE(backoff.nextDelay().has_value());
}

TEST_F(ExponentialBackoffTest, ZeroBaseDelayNeverSleeps) {
    const RetryPolicy policy{
        std::chrono::microseconds{0L},
        std::chrono::microseconds{1000L},
        4,
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    for (int i = 0; i < policy.failureThreshold - 1; ++i) {
        EXPECT_EQ(backoff.nextDelay().value(), std::chrono::microseconds{0L});
    }
}

TEST_F(ExponentialBackoffTest, LargeAttemptDoesNotOverflow) {
    const RetryPolicy policy{
        std::chrono::microseconds{1L},
        std::chrono::microseconds{1000000L},
        80,
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    for (int i = 0; i < policy.failureThreshold - 1; ++i) {
        auto delay = backoff.nextDelay();
        ASSERT_TRUE(delay.has_value());
        EXPECT_GE(delay.value(), std::chrono::microseconds{0L});
        EXPECT_LE(delay.value(), policy.maxDelay);
    }
}
