#include <gtest/gtest.h>

#include "infra/retry.hpp"

using namespace persevere::infra;

namespace {

auto transient() -> Error { return make_error(ErrorCode::RemoteFailure, "503 Slow Down"); }

} // namespace

TEST(RetryTest, ReturnsFirstSuccessWithoutRetrying)
{
    int calls = 0;
    auto result = with_retry([&]() -> Result<int> { ++calls; return 7; }, RetryPolicy{}, "op");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, RetriesTransientFailuresUntilSuccess)
{
    int calls = 0;
    auto result = with_retry([&]() -> Result<int> {
        if (++calls < 3) return std::unexpected(transient());
        return 42;
    }, RetryPolicy{}, "op");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, GivesUpAfterThreeAttemptsByDefault)
{
    int calls = 0;
    auto result = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(transient());
    }, RetryPolicy{}, "op");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_retryable());
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, UnrecoverableFailureStopsImmediately)
{
    int calls = 0;
    auto result = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::IoError, "EIO"));
    }, RetryPolicy{}, "op");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_unrecoverable());
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, ConfiguredAttemptCountIsHonoured)
{
    int calls = 0;
    RetryPolicy policy{.max_attempts = 5};
    auto result = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(transient());
    }, policy, "op");
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(calls, 5);
}

TEST(RetryTest, NoDelayUnlessConfigured)
{
    RetryPolicy immediate{};
    EXPECT_EQ(immediate.delay_before(1).count(), 0);
    EXPECT_EQ(immediate.delay_before(2).count(), 0);

    RetryPolicy backoff{.initial_delay = std::chrono::milliseconds(100), .backoff_factor = 2.0};
    EXPECT_EQ(backoff.delay_before(1).count(), 100);
    EXPECT_EQ(backoff.delay_before(2).count(), 200);
    EXPECT_EQ(backoff.delay_before(3).count(), 400);
}

TEST(RetryTest, HugeBackoffIsCappedAtMaximumDelay)
{
    RetryPolicy policy{.initial_delay = std::chrono::milliseconds(1000), .backoff_factor = 1e30};
    EXPECT_EQ(policy.delay_before(1).count(), 1000);
    EXPECT_EQ(policy.delay_before(2), kMaxRetryDelay);
    EXPECT_EQ(policy.delay_before(60), kMaxRetryDelay);

    RetryPolicy slow{.initial_delay = std::chrono::milliseconds(60'000), .backoff_factor = 2.0};
    EXPECT_EQ(slow.delay_before(6).count(), 1'920'000);
    EXPECT_EQ(slow.delay_before(7), kMaxRetryDelay);
}
