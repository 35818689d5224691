#pragma once

#include <map>
#include <string>

namespace stagehand::core {

/// Error categories: how a handler classifies a failure. Drives the
/// retry decision without string parsing.
enum class ErrorCategory {
  Network,    // Connection / remote service failures
  Timeout,    // Deadline exceeded
  Resource,   // Transient resource exhaustion (rate limit, disk, memory)
  Validation, // Bad input, never retried
  Pipeline,   // Stage logic error
  Canceled,   // Cooperative cancellation
  Store,      // Durable store failure
  Internal,   // Programming error / invariant violation
  Unknown
};

/// Engine-level failure taxonomy.
enum class ErrorKind {
  CycleDetected,
  Validation,
  StageExecution,
  StageTimeout,
  CircuitOpen,
  ParallelExecutionTimeout,
  CriticalStageFailure,
  InsufficientPartialResults,
  LockTimeout,
  LockLost,
  Store,
  Canceled
};

/// Structured error for graph, store and execution operations.
/// Unit failures additionally carry the unit id and the attempt count at
/// the time the failure became terminal.
struct StageError {
  ErrorKind kind = ErrorKind::StageExecution;
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0; // Numeric code for telemetry aggregation
  bool retryable = false;
  std::string message;
  std::string unit_id;
  int attempts = 0;
  std::map<std::string, std::string> details;

  StageError() = default;

  StageError(ErrorKind k, ErrorCategory cat, int c, bool retry,
             std::string msg, std::map<std::string, std::string> dets = {})
      : kind(k), category(cat), code(c), retryable(retry),
        message(std::move(msg)), details(std::move(dets)) {}

  /// Failure reported by a unit handler.
  static StageError Execution(std::string msg,
                              ErrorCategory cat = ErrorCategory::Pipeline,
                              bool retry = false) {
    return {ErrorKind::StageExecution, cat, 2001, retry, std::move(msg)};
  }
  static StageError Timeout(const std::string &unit_id, long long timeout_ms) {
    StageError e(ErrorKind::StageTimeout, ErrorCategory::Timeout, 2002, true,
                 "Unit exceeded its deadline of " + std::to_string(timeout_ms) +
                     "ms",
                 {{"timeout_ms", std::to_string(timeout_ms)}});
    e.unit_id = unit_id;
    return e;
  }
  static StageError CircuitOpen(const std::string &kind_name) {
    return {ErrorKind::CircuitOpen, ErrorCategory::Unknown, 2003, false,
            "Circuit open for kind: " + kind_name, {{"kind", kind_name}}};
  }
  static StageError Canceled(std::string msg = "Operation canceled") {
    return {ErrorKind::Canceled, ErrorCategory::Canceled, 2004, false,
            std::move(msg)};
  }
  static StageError Validation(std::string msg) {
    return {ErrorKind::Validation, ErrorCategory::Validation, 1001, false,
            std::move(msg)};
  }
  static StageError Store(std::string msg) {
    return {ErrorKind::Store, ErrorCategory::Store, 4001, true,
            std::move(msg)};
  }
  static StageError LockTimeout(const std::string &key, long long waited_ms) {
    return {ErrorKind::LockTimeout, ErrorCategory::Store, 4002, true,
            "Timed out acquiring lock: " + key,
            {{"key", key}, {"waited_ms", std::to_string(waited_ms)}}};
  }
  static StageError LockLost(const std::string &key) {
    return {ErrorKind::LockLost, ErrorCategory::Store, 4003, false,
            "Lock is no longer held: " + key, {{"key", key}}};
  }
  static StageError Internal(std::string msg) {
    return {ErrorKind::StageExecution, ErrorCategory::Internal, 9001, false,
            std::move(msg)};
  }
};

/// Convert ErrorCategory to string for logging/serialization.
const char *to_string(ErrorCategory cat);

/// Convert ErrorKind to string for logging/serialization.
const char *to_string(ErrorKind kind);

/// Inverse of to_string(). Unrecognized names map to Unknown.
ErrorCategory error_category_from_string(const std::string &name);

/// Inverse of to_string(). Unrecognized names map to StageExecution.
ErrorKind error_kind_from_string(const std::string &name);

} // namespace stagehand::core
