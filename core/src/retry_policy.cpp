#include "core/retry_policy.h"

#include <algorithm>
#include <cmath>

namespace stagehand::core {

Result<void, StageError> validate(const RetryOptions &options) {
  if (options.max_attempts < 1) {
    return Result<void, StageError>::Err(
        StageError::Validation("retry.max_attempts must be >= 1"));
  }
  if (options.base_delay_ms < 0 || options.max_delay_ms < 0) {
    return Result<void, StageError>::Err(
        StageError::Validation("retry delays must be >= 0"));
  }
  if (options.jitter_ratio < 0.0 || options.jitter_ratio > 1.0) {
    return Result<void, StageError>::Err(
        StageError::Validation("retry.jitter_ratio must be within [0, 1]"));
  }
  return Result<void, StageError>::Ok();
}

RetryPolicy::RetryPolicy(RetryOptions options) : options_(options) {}

bool RetryPolicy::is_retryable(const StageError &error) {
  switch (error.kind) {
  case ErrorKind::StageTimeout:
    return true;
  case ErrorKind::StageExecution:
    break;
  default:
    // Circuit rejections, aborts, cycles, lock and validation failures.
    return false;
  }

  switch (error.category) {
  case ErrorCategory::Timeout:
  case ErrorCategory::Network:
  case ErrorCategory::Resource:
    return true;
  case ErrorCategory::Validation:
  case ErrorCategory::Internal:
  case ErrorCategory::Canceled:
    return false;
  default:
    return error.retryable;
  }
}

std::chrono::milliseconds RetryPolicy::backoff_delay(int attempts,
                                                     double jitter_sample) const {
  const int exponent = std::max(0, attempts - 1);
  const double max_delay = static_cast<double>(options_.max_delay_ms);
  // Cap the exponent so the power never overflows a double.
  double delay = static_cast<double>(options_.base_delay_ms) *
                 std::pow(2.0, std::min(exponent, 62));
  delay = std::min(max_delay, delay);

  if (options_.jitter_ratio > 0.0) {
    const double sample = std::clamp(jitter_sample, 0.0, 1.0);
    delay = delay * (1.0 + (sample - 0.5) * options_.jitter_ratio);
    delay = std::clamp(delay, 0.0, max_delay);
  }
  return std::chrono::milliseconds(static_cast<long long>(delay));
}

RetryDecision RetryPolicy::decide(int attempts, const StageError &error,
                                  double jitter_sample) const {
  RetryDecision decision;
  if (attempts >= options_.max_attempts || !is_retryable(error)) {
    return decision;
  }
  decision.action = RetryAction::Retry;
  decision.delay = backoff_delay(attempts, jitter_sample);
  return decision;
}

} // namespace stagehand::core
