#pragma once

#include "core/result.h"
#include "core/stage_error.h"
#include "core/work_unit.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stagehand::core {

enum class RunStatus { Pending, Running, Completed, Partial, Failed, Aborted };

const char *to_string(RunStatus status);
std::optional<RunStatus> run_status_from_string(const std::string &name);

/// Completed, Partial, Failed and Aborted are final.
bool is_final(RunStatus status);

struct SessionStatistics {
  int total = 0;
  int succeeded = 0;
  int failed = 0;
  int skipped = 0;
  int retries = 0;
  int circuit_rejections = 0;
  int64_t total_duration_ms = 0;
};

/// One persisted state transition. seq is dense and starts at 1, so a
/// consumer can resume polling with events_since(last_seen_seq).
struct ProgressEvent {
  int64_t seq = 0;
  int64_t at_ms = 0;
  std::string unit_id; // Empty for run-level events
  std::string status;  // UnitStatus or RunStatus name
  int attempt = 0;
  std::string message;
};

/// Durable, resumable record of a run. Mutated only through
/// SessionRepository::update(), which bumps `revision` once per write.
struct Session {
  /// Events kept in the document. Older ones are dropped; seq numbering
  /// continues, so events_since() still resumes from any retained seq.
  static constexpr size_t kMaxRetainedEvents = 1000;

  std::string session_id;
  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
  RunStatus overall_status = RunStatus::Pending;
  int64_t revision = 0;
  std::map<std::string, ExecutionState> unit_states;
  SessionStatistics statistics;
  std::vector<ProgressEvent> events;
  int64_t next_event_seq = 1;
  std::optional<StageError> last_error;

  /// Append an event with the next sequence number, dropping the oldest
  /// once more than kMaxRetainedEvents are held.
  const ProgressEvent &append_event(std::string unit_id, std::string status,
                                    int attempt, std::string message,
                                    int64_t at_ms);

  /// Events with seq > after_seq, oldest first.
  [[nodiscard]] std::vector<ProgressEvent> events_since(int64_t after_seq) const;

  /// Recount total/succeeded/failed/skipped from unit_states restricted to
  /// `unit_ids` (all units when empty). Retry and rejection counters are
  /// accumulated by the engine and left alone.
  void recompute_statistics(const std::vector<std::string> &unit_ids = {});
};

/// Serializes Sessions for the DurableStore. Implementations live in infra.
class ISessionCodec {
public:
  virtual ~ISessionCodec() = default;

  [[nodiscard]] virtual std::string encode(const Session &session) const = 0;

  virtual Result<Session, StageError> decode(const std::string &payload) const = 0;
};

} // namespace stagehand::core
