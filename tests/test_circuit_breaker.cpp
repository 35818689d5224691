#include <gtest/gtest.h>

#include "core/circuit_breaker.h"

#include <chrono>

using namespace stagehand::core;

namespace {

/// Manually advanced clock for breaker timing.
struct FakeClock {
  CircuitBreaker::Clock::time_point now = CircuitBreaker::Clock::time_point{};

  CircuitBreaker::ClockFn fn() {
    return [this]() { return now; };
  }
  void advance(int ms) { now += std::chrono::milliseconds(ms); }
};

CircuitBreakerOptions options(int threshold, int reset_ms, int trials = 1) {
  CircuitBreakerOptions o;
  o.failure_threshold = threshold;
  o.reset_timeout_ms = reset_ms;
  o.half_open_max_attempts = trials;
  return o;
}

} // namespace

TEST(CircuitBreaker, DefaultsMatchDocumentedValues) {
  CircuitBreakerOptions o;
  EXPECT_EQ(o.failure_threshold, 5);
  EXPECT_EQ(o.reset_timeout_ms, 60000);
  EXPECT_EQ(o.half_open_max_attempts, 1);
}

TEST(CircuitBreaker, OpensExactlyAtThreshold) {
  FakeClock clock;
  CircuitBreaker breaker(options(3, 1000), clock.fn());

  for (int i = 0; i < 2; ++i) {
    ASSERT_TRUE(breaker.allow_request());
    breaker.record_failure();
    ASSERT_EQ(breaker.state(), CircuitState::Closed) << "after failure " << i + 1;
  }
  ASSERT_TRUE(breaker.allow_request());
  breaker.record_failure();
  ASSERT_EQ(breaker.state(), CircuitState::Open);
  ASSERT_FALSE(breaker.allow_request());
  ASSERT_EQ(breaker.rejected_count(), 1);
}

TEST(CircuitBreaker, SuccessResetsConsecutiveCount) {
  FakeClock clock;
  CircuitBreaker breaker(options(3, 1000), clock.fn());

  breaker.record_failure();
  breaker.record_failure();
  breaker.record_success();
  ASSERT_EQ(breaker.consecutive_failures(), 0);
  breaker.record_failure();
  breaker.record_failure();
  ASSERT_EQ(breaker.state(), CircuitState::Closed);
}

TEST(CircuitBreaker, HalfOpenAfterResetTimeout) {
  FakeClock clock;
  CircuitBreaker breaker(options(1, 1000), clock.fn());

  breaker.record_failure();
  ASSERT_EQ(breaker.state(), CircuitState::Open);
  clock.advance(400);
  ASSERT_FALSE(breaker.allow_request());
  ASSERT_EQ(breaker.remaining_open_ms(), 600);

  clock.advance(600);
  ASSERT_TRUE(breaker.allow_request()); // The single trial
  ASSERT_EQ(breaker.state(), CircuitState::HalfOpen);
  ASSERT_FALSE(breaker.allow_request()); // Trial budget spent

  breaker.record_success();
  ASSERT_EQ(breaker.state(), CircuitState::Closed);
  ASSERT_TRUE(breaker.allow_request());
}

TEST(CircuitBreaker, FailedTrialReopens) {
  FakeClock clock;
  CircuitBreaker breaker(options(2, 500), clock.fn());

  breaker.record_failure();
  breaker.record_failure();
  clock.advance(500);
  ASSERT_TRUE(breaker.allow_request());
  breaker.record_failure();
  ASSERT_EQ(breaker.state(), CircuitState::Open);
  ASSERT_TRUE(breaker.opened_at() == clock.now);
  ASSERT_FALSE(breaker.allow_request());
}

TEST(CircuitBreaker, HalfOpenTrialBudget) {
  FakeClock clock;
  CircuitBreaker breaker(options(1, 100, 2), clock.fn());

  breaker.record_failure();
  clock.advance(100);
  ASSERT_TRUE(breaker.allow_request());
  ASSERT_TRUE(breaker.allow_request());
  ASSERT_FALSE(breaker.allow_request());
}

TEST(CircuitBreaker, OptionsValidation) {
  EXPECT_TRUE(validate(options(1, 0)).is_ok());
  EXPECT_TRUE(validate(options(0, 100)).is_err());
  EXPECT_TRUE(validate(options(1, -1)).is_err());
  EXPECT_TRUE(validate(options(1, 100, 0)).is_err());
}

TEST(CircuitBreakerRegistry, KindsAreIsolated) {
  FakeClock clock;
  CircuitBreakerRegistry registry(options(2, 1000), clock.fn());

  registry.for_kind("fetch").record_failure();
  registry.for_kind("fetch").record_failure();

  ASSERT_EQ(registry.for_kind("fetch").state(), CircuitState::Open);
  ASSERT_EQ(registry.for_kind("render").state(), CircuitState::Closed);
  ASSERT_TRUE(registry.for_kind("render").allow_request());

  auto states = registry.states();
  ASSERT_EQ(states.size(), 2u);
  ASSERT_EQ(states.at("fetch"), CircuitState::Open);

  registry.reset();
  ASSERT_EQ(registry.for_kind("fetch").state(), CircuitState::Closed);
}
