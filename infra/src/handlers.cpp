#include "infra/handlers.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace stagehand::infra {

using core::Result;
using core::StageError;

namespace {

constexpr int kSleepSliceMs = 10;

Result<int, StageError> param_int(const core::WorkUnit &unit,
                                  const std::string &key, int fallback) {
  auto it = unit.params.find(key);
  if (it == unit.params.end()) {
    return Result<int, StageError>::Ok(fallback);
  }
  try {
    size_t used = 0;
    const int value = std::stoi(it->second, &used);
    if (used != it->second.size() || value < 0) {
      throw std::invalid_argument(it->second);
    }
    return Result<int, StageError>::Ok(value);
  } catch (const std::exception &) {
    return Result<int, StageError>::Err(StageError::Validation(
        "Unit '" + unit.id + "': param '" + key +
        "' must be a non-negative integer, got '" + it->second + "'"));
  }
}

std::string param_string(const core::WorkUnit &unit, const std::string &key,
                         std::string fallback) {
  auto it = unit.params.find(key);
  return it == unit.params.end() ? std::move(fallback) : it->second;
}

} // namespace

// ========== NoopHandler ==========

Result<void, StageError> NoopHandler::execute(const core::WorkUnit &unit,
                                              core::UnitContext &ctx) {
  ctx.set_output(unit.id + ".done", "true");
  return Result<void, StageError>::Ok();
}

// ========== SleepHandler ==========

Result<void, StageError> SleepHandler::execute(const core::WorkUnit &unit,
                                               core::UnitContext &ctx) {
  auto duration = param_int(unit, "duration_ms", 100);
  if (duration.is_err()) {
    return Result<void, StageError>::Err(duration.error());
  }

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(duration.value());
  while (std::chrono::steady_clock::now() < deadline) {
    if (ctx.is_canceled()) {
      return Result<void, StageError>::Err(
          StageError::Canceled("Sleep interrupted: " + unit.id));
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(
        std::min(left, std::chrono::milliseconds(kSleepSliceMs)));
  }
  ctx.set_output(unit.id + ".slept_ms", std::to_string(duration.value()));
  return Result<void, StageError>::Ok();
}

// ========== FailHandler ==========

Result<void, StageError> FailHandler::execute(const core::WorkUnit &unit,
                                              core::UnitContext &) {
  const auto category =
      core::error_category_from_string(param_string(unit, "category", "Pipeline"));
  const bool retryable = param_string(unit, "retryable", "false") == "true";
  return Result<void, StageError>::Err(StageError::Execution(
      param_string(unit, "message", "Unit '" + unit.id + "' failed on purpose"),
      category, retryable));
}

// ========== FlakyHandler ==========

Result<void, StageError> FlakyHandler::execute(const core::WorkUnit &unit,
                                               core::UnitContext &ctx) {
  auto failures = param_int(unit, "failures", 1);
  if (failures.is_err()) {
    return Result<void, StageError>::Err(failures.error());
  }
  if (ctx.attempt <= failures.value()) {
    return Result<void, StageError>::Err(StageError::Execution(
        "Transient failure on attempt " + std::to_string(ctx.attempt),
        core::ErrorCategory::Network, true));
  }
  ctx.set_output(unit.id + ".attempts", std::to_string(ctx.attempt));
  return Result<void, StageError>::Ok();
}

void register_builtin_handlers(core::HandlerRegistry &registry) {
  registry.register_handler("noop", std::make_shared<NoopHandler>());
  registry.register_handler("sleep", std::make_shared<SleepHandler>());
  registry.register_handler("fail", std::make_shared<FailHandler>());
  registry.register_handler("flaky", std::make_shared<FlakyHandler>());
}

} // namespace stagehand::infra
