#include <gtest/gtest.h>
#include <agenttreasury/retry.hpp>

using namespace agenttreasury;
using namespace std::chrono_literals;

// ===========================================================================
// Backoff
// ===========================================================================

TEST(RetryTest, BackoffWithoutJitterDoublesUpToCap) {
    EXPECT_EQ(calculate_backoff_with_jitter(0, 10ms, 100ms, 0), 10ms);
    EXPECT_EQ(calculate_backoff_with_jitter(1, 10ms, 100ms, 0), 20ms);
    EXPECT_EQ(calculate_backoff_with_jitter(3, 10ms, 100ms, 0), 80ms);
    EXPECT_EQ(calculate_backoff_with_jitter(4, 10ms, 100ms, 0), 100ms);
    EXPECT_EQ(calculate_backoff_with_jitter(500, 10ms, 100ms, 0), 100ms);
}

TEST(RetryTest, JitterStaysWithinBand) {
    for (int i = 0; i < 200; ++i) {
        auto d = calculate_backoff_with_jitter(2, 100ms, 10s, 20);
        EXPECT_GE(d, 320ms);
        EXPECT_LE(d, 480ms);
    }
}

TEST(RetryTest, NeverNegative) {
    EXPECT_EQ(calculate_backoff_with_jitter(0, 0ms, 0ms, 100), 0ms);
}

// ===========================================================================
// retry_transient
// ===========================================================================

TEST(RetryTest, ReturnsFirstSuccess) {
    RetryConfig config{5, 0ms, 0ms, 0};
    int calls = 0;
    int result = retry_transient(config, [&] {
        if (++calls < 3) {
            throw StoreUnavailableException("test", "down");
        }
        return 42;
    });
    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, RethrowsAfterMaxAttempts) {
    RetryConfig config{4, 0ms, 0ms, 0};
    int calls = 0;
    EXPECT_THROW(retry_transient(config, [&] {
        ++calls;
        throw ContentionExceededException("k", 1);
    }), ContentionExceededException);
    EXPECT_EQ(calls, 4);
}

TEST(RetryTest, NonTransientPropagatesImmediately) {
    RetryConfig config{4, 0ms, 0ms, 0};
    int calls = 0;
    EXPECT_THROW(retry_transient(config, [&] {
        ++calls;
        throw CorruptRecordException("budget", "bad");
    }), CorruptRecordException);
    EXPECT_EQ(calls, 1);
}
