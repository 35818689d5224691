#pragma once

#include "core/result.h"
#include "core/stage_error.h"
#include "core/work_unit.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace stagehand::core {

/// Immutable DAG view over a work-unit set.
///
/// build() validates ids and edges, rejects cycles and groups units into
/// waves: wave 0 holds units without dependencies, and a unit's wave index
/// is one more than the highest wave index among its dependencies. Every
/// wave is therefore a set of mutually independent units, ordered by
/// priority (descending) then id (ascending).
class DependencyGraph {
public:
  DependencyGraph() = default;

  /// Validate `units` and build the graph.
  /// Errors: ErrorKind::Validation for empty/duplicate ids, self-dependency
  /// or unknown dependency ids; ErrorKind::CycleDetected (details["cycle"]
  /// holds the ids along the cycle) when the edges are not acyclic.
  static Result<DependencyGraph, StageError> build(std::vector<WorkUnit> units);

  [[nodiscard]] const std::vector<std::vector<std::string>> &waves() const {
    return waves_;
  }

  [[nodiscard]] const std::vector<std::string> &topological_order() const {
    return topo_order_;
  }

  [[nodiscard]] std::size_t size() const { return units_.size(); }
  [[nodiscard]] bool contains(const std::string &id) const;

  /// nullptr when `id` is not part of the graph.
  [[nodiscard]] const WorkUnit *find(const std::string &id) const;

  /// Wave index of `id`, -1 when unknown.
  [[nodiscard]] int wave_of(const std::string &id) const;

  [[nodiscard]] const std::vector<std::string> &
  dependencies(const std::string &id) const;

  [[nodiscard]] const std::vector<std::string> &
  dependents(const std::string &id) const;

  /// All transitive dependents of `id`, in topological order.
  [[nodiscard]] std::vector<std::string>
  affected_by(const std::string &id) const;

  /// Dependency chain with the highest cumulative estimated cost
  /// (missing costs count as 1). Reporting only.
  [[nodiscard]] std::vector<std::string> critical_path() const;

  /// Cumulative cost of critical_path().
  [[nodiscard]] double critical_path_cost() const;

private:
  std::unordered_map<std::string, WorkUnit> units_;
  std::unordered_map<std::string, std::vector<std::string>> dependents_;
  std::unordered_map<std::string, int> wave_index_;
  std::vector<std::string> topo_order_;
  std::vector<std::vector<std::string>> waves_;
};

} // namespace stagehand::core
