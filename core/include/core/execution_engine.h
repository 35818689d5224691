#pragma once

#include "core/circuit_breaker.h"
#include "core/result.h"
#include "core/retry_policy.h"
#include "core/session.h"
#include "core/session_repository.h"
#include "core/stage_error.h"
#include "core/unit_handler.h"
#include "core/work_unit.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stagehand::core {

class ILogger;

/// Engine runtime configuration.
struct EngineOptions {
  std::string session_id; // Empty: a fresh id is generated
  int global_concurrency = 4;
  int per_unit_timeout_ms = 300000;
  std::map<std::string, int> kind_timeout_ms; // Per-kind override
  int whole_run_timeout_ms = 0;               // 0 = unbounded
  bool fail_fast = false;
  std::set<std::string> required_unit_ids;
  bool allow_partial_results = false;
  double min_success_ratio = 1.0;
  /// A running claim by another engine whose heartbeat is older than this
  /// is taken over. 0 = unit timeout + retry max delay + lock TTL.
  int claim_stale_after_ms = 0;
  CircuitBreakerOptions circuit_breaker{};
  RetryOptions retry{};
};

/// Validate option ranges (concurrency >= 1, timeouts, ratio in [0, 1],
/// breaker and retry options).
Result<void, StageError> validate(const EngineOptions &options);

struct UnitReport {
  std::string id;
  std::string kind;
  UnitStatus status = UnitStatus::Pending;
  int attempts = 0;
  int64_t duration_ms = 0;
  std::optional<StageError> error;
};

/// Structured outcome of run(). Produced for failed runs too.
struct RunReport {
  std::string session_id;
  RunStatus overall_status = RunStatus::Pending;
  std::vector<UnitReport> per_unit; // Topological order
  SessionStatistics statistics;
  std::vector<std::vector<std::string>> waves;
  std::vector<std::string> critical_path;
  std::optional<StageError> error; // Run-level cause for failed/aborted runs
};

/// ExecutionEngine: runs a work-unit DAG wave by wave.
///
/// Responsibilities:
///   1. Validate the unit set (DependencyGraph) and the handler registry
///   2. Open or resume the Session for options.session_id
///   3. Dispatch each wave with at most global_concurrency units running,
///      gated per kind by a circuit breaker, bounded by per-unit and
///      whole-run deadlines, retried per RetryPolicy
///   4. Persist every state transition through the SessionRepository
///   5. Classify the outcome (completed / partial / failed / aborted)
///
/// Does NOT know what a unit does; that is the registered handler's job.
/// One run() at a time per engine instance.
class ExecutionEngine {
public:
  ExecutionEngine(std::shared_ptr<SessionRepository> sessions,
                  HandlerRegistry handlers,
                  std::shared_ptr<ILogger> logger = nullptr,
                  CircuitBreaker::ClockFn breaker_clock = {});
  ~ExecutionEngine();

  ExecutionEngine(const ExecutionEngine &) = delete;
  ExecutionEngine &operator=(const ExecutionEngine &) = delete;

  /// Run (or resume) the given units. Err only when the run cannot start:
  /// invalid graph or options, missing handler, LockTimeout or store failure
  /// while opening the Session.
  Result<RunReport, StageError> run(std::vector<WorkUnit> units,
                                    const EngineOptions &options);

  /// Abort the current run: in-flight attempts are canceled, the rest is
  /// skipped and the Session is finalized as aborted. No-op when idle.
  void cancel();

  /// Progress event callback, invoked once per persisted state transition
  /// from the engine's worker threads.
  using EventCallback =
      std::function<void(const std::string &session_id, const ProgressEvent &)>;
  void on_event(EventCallback cb);

  /// Identifies this engine in running claims.
  [[nodiscard]] const std::string &instance_id() const { return instance_id_; }

private:
  class Run;

  std::shared_ptr<SessionRepository> sessions_;
  HandlerRegistry handlers_;
  std::shared_ptr<ILogger> logger_;
  CircuitBreaker::ClockFn breaker_clock_;
  std::string instance_id_;

  std::mutex mutex_;
  std::vector<EventCallback> callbacks_;
  std::shared_ptr<Run> active_run_;
  std::atomic<bool> running_{false};
};

} // namespace stagehand::core
