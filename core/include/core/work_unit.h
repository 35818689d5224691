#pragma once

#include "core/result.h"
#include "core/stage_error.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stagehand::core {

// ---- Unit Status Enum ----

enum class UnitStatus {
  Pending,   // Not yet evaluated, no dependencies
  Blocked,   // Waiting for dependencies to reach a terminal state
  Ready,     // Dependencies satisfied, being claimed by a worker
  Running,   // An attempt is in flight
  Succeeded, // Completed successfully (terminal)
  Failed,    // Failed after exhausting its retry budget (terminal)
  Skipped    // Never ran: dependency failed or run aborted (terminal)
};

/// Convert UnitStatus to string for logging/serialization.
const char *to_string(UnitStatus status);

/// Inverse of to_string(UnitStatus). Returns nullopt for unknown names.
std::optional<UnitStatus> unit_status_from_string(const std::string &name);

/// Succeeded, Failed and Skipped are terminal for a single run.
bool is_terminal(UnitStatus status);

// ---- Work Unit ----

/// A schedulable unit of work. Immutable for the duration of a run.
/// `kind` selects the handler; `params` are the handler's typed inputs.
struct WorkUnit {
  std::string id;   // Unique, stable identifier
  std::string kind; // Operation tag, resolved through the HandlerRegistry
  std::vector<std::string> depends_on;
  int priority = 0; // Higher runs first within a wave
  std::optional<double> estimated_cost;
  std::optional<int> timeout_override_ms;
  std::map<std::string, std::string> params;
};

// ---- Execution State ----

/// Per-unit mutable state, persisted inside the Session.
/// Owns its state machine: transitions are validated via transition_to().
struct ExecutionState {
  UnitStatus status = UnitStatus::Pending;
  int attempt_count = 0;
  std::optional<StageError> last_error;
  std::optional<int64_t> started_at_ms;  // Wall clock, epoch milliseconds
  std::optional<int64_t> finished_at_ms; // Wall clock, epoch milliseconds
  std::string owner; // Engine instance holding the Running claim
  std::optional<int64_t> heartbeat_at_ms; // Refreshed at every attempt start
  std::map<std::string, std::string> outputs;

  /// Attempt a state transition. Returns Err if the transition is illegal.
  /// Legal transitions:
  ///   Pending  → Ready, Blocked, Skipped
  ///   Blocked  → Ready, Skipped
  ///   Ready    → Running, Skipped
  ///   Running  → Succeeded, Failed, Skipped, Ready (stale claim takeover)
  ///   Failed   → Pending, Blocked (reset on resume)
  ///   Skipped  → Pending, Blocked (reset on resume)
  Result<void, StageError> transition_to(UnitStatus new_status,
                                         int64_t now_ms);

  /// Duration of the last run in milliseconds, 0 if it never finished.
  [[nodiscard]] int64_t duration_ms() const;
};

/// Wall-clock milliseconds since the Unix epoch.
int64_t now_epoch_ms();

} // namespace stagehand::core
