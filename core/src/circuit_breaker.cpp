#include "core/circuit_breaker.h"

#include <algorithm>

namespace stagehand::core {

const char *to_string(CircuitState state) {
  switch (state) {
  case CircuitState::Closed:
    return "closed";
  case CircuitState::Open:
    return "open";
  case CircuitState::HalfOpen:
    return "half-open";
  }
  return "unknown";
}

Result<void, StageError> validate(const CircuitBreakerOptions &options) {
  if (options.failure_threshold < 1) {
    return Result<void, StageError>::Err(StageError::Validation(
        "circuit_breaker.failure_threshold must be >= 1"));
  }
  if (options.reset_timeout_ms < 0) {
    return Result<void, StageError>::Err(StageError::Validation(
        "circuit_breaker.reset_timeout_ms must be >= 0"));
  }
  if (options.half_open_max_attempts < 1) {
    return Result<void, StageError>::Err(StageError::Validation(
        "circuit_breaker.half_open_max_attempts must be >= 1"));
  }
  return Result<void, StageError>::Ok();
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions options, ClockFn clock)
    : options_(options), clock_(std::move(clock)) {
  options_.failure_threshold = std::max(1, options_.failure_threshold);
  options_.reset_timeout_ms = std::max(0, options_.reset_timeout_ms);
  options_.half_open_max_attempts = std::max(1, options_.half_open_max_attempts);
}

CircuitBreaker::Clock::time_point CircuitBreaker::now() const {
  return clock_ ? clock_() : Clock::now();
}

bool CircuitBreaker::reset_elapsed_locked(Clock::time_point now) const {
  if (!opened_at_.has_value()) {
    return true;
  }
  return now - *opened_at_ >= std::chrono::milliseconds(options_.reset_timeout_ms);
}

void CircuitBreaker::trip_locked(Clock::time_point now) {
  state_ = CircuitState::Open;
  opened_at_ = now;
  half_open_in_flight_ = 0;
}

bool CircuitBreaker::allow_request() {
  const auto t = now();
  std::lock_guard<std::mutex> lock(mutex_);

  switch (state_) {
  case CircuitState::Closed:
    return true;
  case CircuitState::Open:
    if (reset_elapsed_locked(t)) {
      state_ = CircuitState::HalfOpen;
      half_open_in_flight_ = 1;
      return true;
    }
    ++rejected_;
    return false;
  case CircuitState::HalfOpen:
    if (half_open_in_flight_ < options_.half_open_max_attempts) {
      ++half_open_in_flight_;
      return true;
    }
    ++rejected_;
    return false;
  }
  return false;
}

void CircuitBreaker::record_success() {
  std::lock_guard<std::mutex> lock(mutex_);
  consecutive_failures_ = 0;
  if (state_ == CircuitState::HalfOpen) {
    state_ = CircuitState::Closed;
    half_open_in_flight_ = 0;
    opened_at_.reset();
  }
}

void CircuitBreaker::record_failure() {
  const auto t = now();
  std::lock_guard<std::mutex> lock(mutex_);
  ++consecutive_failures_;

  switch (state_) {
  case CircuitState::Closed:
    if (consecutive_failures_ >= options_.failure_threshold) {
      trip_locked(t);
    }
    break;
  case CircuitState::HalfOpen:
    trip_locked(t);
    break;
  case CircuitState::Open:
    // Late report from an attempt admitted before the trip.
    break;
  }
}

CircuitState CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int CircuitBreaker::consecutive_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consecutive_failures_;
}

int CircuitBreaker::rejected_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rejected_;
}

std::optional<CircuitBreaker::Clock::time_point>
CircuitBreaker::opened_at() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return opened_at_;
}

long long CircuitBreaker::remaining_open_ms() const {
  const auto t = now();
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != CircuitState::Open || !opened_at_.has_value()) {
    return 0;
  }
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(t - *opened_at_)
          .count();
  return std::max<long long>(0, options_.reset_timeout_ms - elapsed);
}

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerOptions options,
                                               CircuitBreaker::ClockFn clock)
    : options_(options), clock_(std::move(clock)) {}

CircuitBreaker &CircuitBreakerRegistry::for_kind(const std::string &kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = breakers_[kind];
  if (!slot) {
    slot = std::make_unique<CircuitBreaker>(options_, clock_);
  }
  return *slot;
}

std::map<std::string, CircuitState> CircuitBreakerRegistry::states() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, CircuitState> out;
  for (const auto &[kind, breaker] : breakers_) {
    out.emplace(kind, breaker->state());
  }
  return out;
}

void CircuitBreakerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  breakers_.clear();
}

} // namespace stagehand::core
