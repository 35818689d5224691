#pragma once

#include "core/result.h"
#include "core/stage_error.h"

#include <chrono>

namespace stagehand::core {

struct RetryOptions {
  int max_attempts = 3; // Total attempts including the first
  int base_delay_ms = 1000;
  int max_delay_ms = 30000;
  double jitter_ratio = 0.0; // 0 disables jitter, (0, 1] spreads the delay
};

/// Validate retry options (attempts >= 1, delays >= 0, jitter in [0, 1]).
Result<void, StageError> validate(const RetryOptions &options);

enum class RetryAction { Retry, GiveUp };

struct RetryDecision {
  RetryAction action = RetryAction::GiveUp;
  std::chrono::milliseconds delay{0};
};

/// Bounded exponential-backoff retry decisions. Stateless: the caller tracks
/// attempts and performs the wait.
class RetryPolicy {
public:
  explicit RetryPolicy(RetryOptions options);

  /// `attempts` is the number of attempts already made (>= 1).
  /// `jitter_sample` is a uniform sample in [0, 1]; 0.5 means no jitter.
  [[nodiscard]] RetryDecision decide(int attempts, const StageError &error,
                                     double jitter_sample = 0.5) const;

  /// min(max_delay, base_delay * 2^(attempts-1)), then jittered.
  [[nodiscard]] std::chrono::milliseconds
  backoff_delay(int attempts, double jitter_sample = 0.5) const;

  /// Timeouts, network and resource errors, and anything a handler flagged
  /// retryable. Validation, internal, cancellation and engine-level
  /// rejections never are.
  [[nodiscard]] static bool is_retryable(const StageError &error);

  [[nodiscard]] const RetryOptions &options() const { return options_; }

private:
  RetryOptions options_;
};

} // namespace stagehand::core
