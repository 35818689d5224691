#include "core/stage_error.h"

#include <array>
#include <utility>

namespace stagehand::core {

namespace {

constexpr std::array<std::pair<ErrorCategory, const char *>, 9> kCategories{{
    {ErrorCategory::Network, "Network"},
    {ErrorCategory::Timeout, "Timeout"},
    {ErrorCategory::Resource, "Resource"},
    {ErrorCategory::Validation, "Validation"},
    {ErrorCategory::Pipeline, "Pipeline"},
    {ErrorCategory::Canceled, "Canceled"},
    {ErrorCategory::Store, "Store"},
    {ErrorCategory::Internal, "Internal"},
    {ErrorCategory::Unknown, "Unknown"},
}};

constexpr std::array<std::pair<ErrorKind, const char *>, 12> kKinds{{
    {ErrorKind::CycleDetected, "CycleDetectedError"},
    {ErrorKind::Validation, "ValidationError"},
    {ErrorKind::StageExecution, "StageExecutionError"},
    {ErrorKind::StageTimeout, "StageTimeoutError"},
    {ErrorKind::CircuitOpen, "CircuitOpenError"},
    {ErrorKind::ParallelExecutionTimeout, "ParallelExecutionTimeoutError"},
    {ErrorKind::CriticalStageFailure, "CriticalStageFailureError"},
    {ErrorKind::InsufficientPartialResults, "InsufficientPartialResultsError"},
    {ErrorKind::LockTimeout, "LockTimeoutError"},
    {ErrorKind::LockLost, "LockLostError"},
    {ErrorKind::Store, "StoreError"},
    {ErrorKind::Canceled, "CanceledError"},
}};

} // namespace

const char *to_string(ErrorCategory cat) {
  for (const auto &[value, name] : kCategories) {
    if (value == cat) {
      return name;
    }
  }
  return "Unknown";
}

const char *to_string(ErrorKind kind) {
  for (const auto &[value, name] : kKinds) {
    if (value == kind) {
      return name;
    }
  }
  return "StageExecutionError";
}

ErrorCategory error_category_from_string(const std::string &name) {
  for (const auto &[value, label] : kCategories) {
    if (name == label) {
      return value;
    }
  }
  return ErrorCategory::Unknown;
}

ErrorKind error_kind_from_string(const std::string &name) {
  for (const auto &[value, label] : kKinds) {
    if (name == label) {
      return value;
    }
  }
  return ErrorKind::StageExecution;
}

} // namespace stagehand::core
