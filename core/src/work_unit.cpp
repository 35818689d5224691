#include "core/work_unit.h"

#include <chrono>

namespace stagehand::core {

const char *to_string(UnitStatus status) {
  switch (status) {
  case UnitStatus::Pending:
    return "pending";
  case UnitStatus::Blocked:
    return "blocked";
  case UnitStatus::Ready:
    return "ready";
  case UnitStatus::Running:
    return "running";
  case UnitStatus::Succeeded:
    return "succeeded";
  case UnitStatus::Failed:
    return "failed";
  case UnitStatus::Skipped:
    return "skipped";
  }
  return "unknown";
}

std::optional<UnitStatus> unit_status_from_string(const std::string &name) {
  for (auto status : {UnitStatus::Pending, UnitStatus::Blocked,
                      UnitStatus::Ready, UnitStatus::Running,
                      UnitStatus::Succeeded, UnitStatus::Failed,
                      UnitStatus::Skipped}) {
    if (name == to_string(status)) {
      return status;
    }
  }
  return std::nullopt;
}

bool is_terminal(UnitStatus status) {
  switch (status) {
  case UnitStatus::Succeeded:
  case UnitStatus::Failed:
  case UnitStatus::Skipped:
    return true;
  default:
    return false;
  }
}

Result<void, StageError> ExecutionState::transition_to(UnitStatus new_status,
                                                       int64_t now_ms) {
  // Table-driven legality check.
  bool legal = false;

  switch (status) {
  case UnitStatus::Pending:
    legal = (new_status == UnitStatus::Ready ||
             new_status == UnitStatus::Blocked ||
             new_status == UnitStatus::Skipped);
    break;
  case UnitStatus::Blocked:
    legal = (new_status == UnitStatus::Ready ||
             new_status == UnitStatus::Skipped);
    break;
  case UnitStatus::Ready:
    legal = (new_status == UnitStatus::Running ||
             new_status == UnitStatus::Skipped);
    break;
  case UnitStatus::Running:
    legal = (new_status == UnitStatus::Succeeded ||
             new_status == UnitStatus::Failed ||
             new_status == UnitStatus::Skipped ||
             new_status == UnitStatus::Ready);
    break;
  case UnitStatus::Failed:
  case UnitStatus::Skipped:
    legal = (new_status == UnitStatus::Pending ||
             new_status == UnitStatus::Blocked);
    break;
  case UnitStatus::Succeeded:
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, StageError>::Err(StageError::Internal(
        std::string("Illegal state transition: ") + to_string(status) +
        " -> " + to_string(new_status)));
  }

  const UnitStatus old_status = status;
  status = new_status;

  if (new_status == UnitStatus::Running && old_status == UnitStatus::Ready &&
      !started_at_ms.has_value()) {
    started_at_ms = now_ms;
  }
  if (is_terminal(new_status)) {
    finished_at_ms = now_ms;
  }

  // Reset bookkeeping when a resumed run re-queues the unit.
  if (is_terminal(old_status) && !is_terminal(new_status)) {
    attempt_count = 0;
    started_at_ms.reset();
    finished_at_ms.reset();
    owner.clear();
    heartbeat_at_ms.reset();
    outputs.clear();
  }

  return Result<void, StageError>::Ok();
}

int64_t ExecutionState::duration_ms() const {
  if (!started_at_ms.has_value() || !finished_at_ms.has_value()) {
    return 0;
  }
  return *finished_at_ms > *started_at_ms ? *finished_at_ms - *started_at_ms
                                          : 0;
}

int64_t now_epoch_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace stagehand::core
