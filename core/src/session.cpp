#include "core/session.h"

#include <algorithm>
#include <cstddef>

namespace stagehand::core {

const char *to_string(RunStatus status) {
  switch (status) {
  case RunStatus::Pending:
    return "pending";
  case RunStatus::Running:
    return "running";
  case RunStatus::Completed:
    return "completed";
  case RunStatus::Partial:
    return "partial";
  case RunStatus::Failed:
    return "failed";
  case RunStatus::Aborted:
    return "aborted";
  }
  return "unknown";
}

std::optional<RunStatus> run_status_from_string(const std::string &name) {
  for (auto status : {RunStatus::Pending, RunStatus::Running,
                      RunStatus::Completed, RunStatus::Partial,
                      RunStatus::Failed, RunStatus::Aborted}) {
    if (name == to_string(status)) {
      return status;
    }
  }
  return std::nullopt;
}

bool is_final(RunStatus status) {
  return status == RunStatus::Completed || status == RunStatus::Partial ||
         status == RunStatus::Failed || status == RunStatus::Aborted;
}

const ProgressEvent &Session::append_event(std::string unit_id,
                                           std::string status, int attempt,
                                           std::string message, int64_t at_ms) {
  ProgressEvent event;
  event.seq = next_event_seq++;
  event.at_ms = at_ms;
  event.unit_id = std::move(unit_id);
  event.status = std::move(status);
  event.attempt = attempt;
  event.message = std::move(message);
  events.push_back(std::move(event));
  if (events.size() > kMaxRetainedEvents) {
    events.erase(events.begin(),
                 events.begin() +
                     static_cast<std::ptrdiff_t>(events.size() - kMaxRetainedEvents));
  }
  return events.back();
}

std::vector<ProgressEvent> Session::events_since(int64_t after_seq) const {
  std::vector<ProgressEvent> out;
  auto it = std::upper_bound(
      events.begin(), events.end(), after_seq,
      [](int64_t seq, const ProgressEvent &event) { return seq < event.seq; });
  out.assign(it, events.end());
  return out;
}

void Session::recompute_statistics(const std::vector<std::string> &unit_ids) {
  statistics.total = 0;
  statistics.succeeded = 0;
  statistics.failed = 0;
  statistics.skipped = 0;

  auto count = [this](const ExecutionState &state) {
    ++statistics.total;
    switch (state.status) {
    case UnitStatus::Succeeded:
      ++statistics.succeeded;
      break;
    case UnitStatus::Failed:
      ++statistics.failed;
      break;
    case UnitStatus::Skipped:
      ++statistics.skipped;
      break;
    default:
      break;
    }
  };

  if (unit_ids.empty()) {
    for (const auto &[_, state] : unit_states) {
      count(state);
    }
    return;
  }
  for (const auto &id : unit_ids) {
    auto it = unit_states.find(id);
    if (it != unit_states.end()) {
      count(it->second);
    }
  }
}

} // namespace stagehand::core
