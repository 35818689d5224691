#pragma once

#include "core/result.h"
#include "core/stage_error.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace stagehand::core {

enum class CircuitState { Closed, Open, HalfOpen };

const char *to_string(CircuitState state);

struct CircuitBreakerOptions {
  int failure_threshold = 5;
  int reset_timeout_ms = 60000;
  int half_open_max_attempts = 1;
};

/// Validate breaker options (threshold >= 1, timeout >= 0, trials >= 1).
Result<void, StageError> validate(const CircuitBreakerOptions &options);

/// Consecutive-failure circuit breaker.
///
///   Closed   --threshold consecutive failures-->  Open
///   Open     --reset timeout elapsed------------>  HalfOpen
///   HalfOpen --trial success-------------------->  Closed
///   HalfOpen --trial failure-------------------->  Open
///
/// While Open every allow_request() is rejected without touching the
/// protected operation. HalfOpen admits at most half_open_max_attempts
/// trials until one of them reports back. Thread-safe.
class CircuitBreaker {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  explicit CircuitBreaker(CircuitBreakerOptions options, ClockFn clock = {});

  /// Admission check. Returns false (and counts a rejection) while open.
  bool allow_request();

  void record_success();
  void record_failure();

  [[nodiscard]] CircuitState state() const;
  [[nodiscard]] int consecutive_failures() const;
  [[nodiscard]] int rejected_count() const;
  [[nodiscard]] std::optional<Clock::time_point> opened_at() const;

  /// Milliseconds until an open breaker admits a trial, 0 otherwise.
  [[nodiscard]] long long remaining_open_ms() const;

private:
  Clock::time_point now() const;
  bool reset_elapsed_locked(Clock::time_point now) const;
  void trip_locked(Clock::time_point now);

  CircuitBreakerOptions options_;
  ClockFn clock_;

  mutable std::mutex mutex_;
  CircuitState state_ = CircuitState::Closed;
  int consecutive_failures_ = 0;
  int half_open_in_flight_ = 0;
  int rejected_ = 0;
  std::optional<Clock::time_point> opened_at_;
};

/// One breaker per work-unit kind, created lazily with shared options.
class CircuitBreakerRegistry {
public:
  explicit CircuitBreakerRegistry(CircuitBreakerOptions options,
                                  CircuitBreaker::ClockFn clock = {});

  /// Returns the breaker for `kind`, creating it closed on first use.
  CircuitBreaker &for_kind(const std::string &kind);

  /// Snapshot of every known breaker's state.
  [[nodiscard]] std::map<std::string, CircuitState> states() const;

  /// Drop all breakers; the next lookup starts closed.
  void reset();

private:
  CircuitBreakerOptions options_;
  CircuitBreaker::ClockFn clock_;
  mutable std::mutex mutex_;
  std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
};

} // namespace stagehand::core
