#pragma once

#include "core/unit_handler.h"

#include <string>

namespace stagehand::infra {

/// NoopHandler - succeeds immediately, records `<unit id>.done = true`.
class NoopHandler : public core::IUnitHandler {
public:
  [[nodiscard]] std::string name() const override { return "NoopHandler"; }

  core::Result<void, core::StageError> execute(const core::WorkUnit &unit,
                                               core::UnitContext &ctx) override;
};

/// SleepHandler - sleeps params["duration_ms"] (default 100) in short
/// slices, returning Canceled as soon as its token fires.
class SleepHandler : public core::IUnitHandler {
public:
  [[nodiscard]] std::string name() const override { return "SleepHandler"; }

  core::Result<void, core::StageError> execute(const core::WorkUnit &unit,
                                               core::UnitContext &ctx) override;
};

/// FailHandler - always fails. params: "category" (ErrorCategory name such
/// as Network, default Pipeline), "message", "retryable" (true/false).
class FailHandler : public core::IUnitHandler {
public:
  [[nodiscard]] std::string name() const override { return "FailHandler"; }

  core::Result<void, core::StageError> execute(const core::WorkUnit &unit,
                                               core::UnitContext &ctx) override;
};

/// FlakyHandler - fails the first params["failures"] attempts (default 1)
/// with a retryable network error, then succeeds.
class FlakyHandler : public core::IUnitHandler {
public:
  [[nodiscard]] std::string name() const override { return "FlakyHandler"; }

  core::Result<void, core::StageError> execute(const core::WorkUnit &unit,
                                               core::UnitContext &ctx) override;
};

/// Register the handlers above as kinds noop, sleep, fail and flaky.
void register_builtin_handlers(core::HandlerRegistry &registry);

} // namespace stagehand::infra
