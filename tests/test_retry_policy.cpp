#include <gtest/gtest.h>

#include "core/retry_policy.h"

using namespace stagehand::core;

namespace {

RetryOptions opts(int attempts, int base_ms, int max_ms, double jitter = 0.0) {
  RetryOptions o;
  o.max_attempts = attempts;
  o.base_delay_ms = base_ms;
  o.max_delay_ms = max_ms;
  o.jitter_ratio = jitter;
  return o;
}

} // namespace

TEST(RetryPolicy, ExponentialBackoffIsCapped) {
  RetryPolicy policy(opts(10, 100, 1000));
  EXPECT_EQ(policy.backoff_delay(1).count(), 100);
  EXPECT_EQ(policy.backoff_delay(2).count(), 200);
  EXPECT_EQ(policy.backoff_delay(3).count(), 400);
  EXPECT_EQ(policy.backoff_delay(4).count(), 800);
  EXPECT_EQ(policy.backoff_delay(5).count(), 1000);
  EXPECT_EQ(policy.backoff_delay(200).count(), 1000);
}

TEST(RetryPolicy, JitterSpreadsAroundTheDelay) {
  RetryPolicy policy(opts(5, 1000, 60000, 0.5));
  EXPECT_EQ(policy.backoff_delay(1, 0.5).count(), 1000);
  EXPECT_EQ(policy.backoff_delay(1, 0.0).count(), 750);
  EXPECT_EQ(policy.backoff_delay(1, 1.0).count(), 1250);
}

TEST(RetryPolicy, JitterNeverExceedsMaxDelay) {
  RetryPolicy policy(opts(5, 1000, 1000, 1.0));
  EXPECT_EQ(policy.backoff_delay(3, 1.0).count(), 1000);
}

TEST(RetryPolicy, RetriesTransientFailuresUntilBudgetSpent) {
  RetryPolicy policy(opts(3, 10, 100));
  const auto err = StageError::Execution("socket reset", ErrorCategory::Network);

  auto first = policy.decide(1, err);
  ASSERT_EQ(first.action, RetryAction::Retry);
  ASSERT_EQ(first.delay.count(), 10);

  auto second = policy.decide(2, err);
  ASSERT_EQ(second.action, RetryAction::Retry);
  ASSERT_EQ(second.delay.count(), 20);

  ASSERT_EQ(policy.decide(3, err).action, RetryAction::GiveUp);
}

TEST(RetryPolicy, SingleAttemptNeverRetries) {
  RetryPolicy policy(opts(1, 10, 100));
  ASSERT_EQ(policy.decide(1, StageError::Timeout("u", 5)).action,
            RetryAction::GiveUp);
}

TEST(RetryPolicy, Classification) {
  EXPECT_TRUE(RetryPolicy::is_retryable(StageError::Timeout("u", 10)));
  EXPECT_TRUE(RetryPolicy::is_retryable(
      StageError::Execution("429", ErrorCategory::Resource)));
  EXPECT_TRUE(RetryPolicy::is_retryable(
      StageError::Execution("flagged", ErrorCategory::Pipeline, true)));

  EXPECT_FALSE(RetryPolicy::is_retryable(
      StageError::Execution("bad input", ErrorCategory::Validation, true)));
  EXPECT_FALSE(RetryPolicy::is_retryable(StageError::Execution("logic")));
  EXPECT_FALSE(RetryPolicy::is_retryable(StageError::Internal("bug")));
  EXPECT_FALSE(RetryPolicy::is_retryable(StageError::CircuitOpen("fetch")));
  EXPECT_FALSE(RetryPolicy::is_retryable(StageError::Canceled()));
  EXPECT_FALSE(RetryPolicy::is_retryable(StageError::LockTimeout("k", 1)));
}

TEST(RetryPolicy, OptionsValidation) {
  EXPECT_TRUE(validate(opts(1, 0, 0)).is_ok());
  EXPECT_TRUE(validate(opts(0, 10, 10)).is_err());
  EXPECT_TRUE(validate(opts(1, -1, 10)).is_err());
  EXPECT_TRUE(validate(opts(1, 10, 10, 1.5)).is_err());
}
