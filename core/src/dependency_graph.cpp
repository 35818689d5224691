#include "core/dependency_graph.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace stagehand::core {

namespace {

enum class Mark { Unvisited, InProgress, Done };

double cost_of(const WorkUnit &unit) {
  return unit.estimated_cost.value_or(1.0);
}

std::string join_ids(const std::vector<std::string> &ids,
                     const std::string &sep) {
  std::string out;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += ids[i];
  }
  return out;
}

/// Depth-first search along dependency edges. Returns the ids on the first
/// cycle found (closing id repeated at the end), or an empty vector.
std::vector<std::string>
find_cycle(const std::unordered_map<std::string, WorkUnit> &units) {
  std::vector<std::string> roots;
  roots.reserve(units.size());
  for (const auto &[id, _] : units) {
    roots.push_back(id);
  }
  std::sort(roots.begin(), roots.end());

  std::unordered_map<std::string, Mark> marks;
  for (const auto &id : roots) {
    marks[id] = Mark::Unvisited;
  }

  struct Frame {
    std::string id;
    size_t next_dep = 0;
  };

  for (const auto &root : roots) {
    if (marks[root] != Mark::Unvisited) {
      continue;
    }

    std::vector<Frame> stack;
    stack.push_back({root, 0});
    marks[root] = Mark::InProgress;

    while (!stack.empty()) {
      Frame &frame = stack.back();
      const auto &deps = units.at(frame.id).depends_on;
      if (frame.next_dep >= deps.size()) {
        marks[frame.id] = Mark::Done;
        stack.pop_back();
        continue;
      }

      const std::string dep = deps[frame.next_dep++];
      const Mark mark = marks[dep];
      if (mark == Mark::InProgress) {
        // Back-edge: the cycle is the stack suffix starting at `dep`.
        std::vector<std::string> cycle;
        bool on_cycle = false;
        for (const auto &f : stack) {
          if (f.id == dep) {
            on_cycle = true;
          }
          if (on_cycle) {
            cycle.push_back(f.id);
          }
        }
        cycle.push_back(dep);
        return cycle;
      }
      if (mark == Mark::Unvisited) {
        marks[dep] = Mark::InProgress;
        stack.push_back({dep, 0});
      }
    }
  }
  return {};
}

} // namespace

Result<DependencyGraph, StageError>
DependencyGraph::build(std::vector<WorkUnit> units) {
  DependencyGraph graph;

  for (auto &unit : units) {
    if (unit.id.empty()) {
      return Result<DependencyGraph, StageError>::Err(
          StageError::Validation("Work unit id must not be empty"));
    }
    if (unit.kind.empty()) {
      auto err = StageError::Validation("Work unit kind must not be empty: " +
                                        unit.id);
      err.unit_id = unit.id;
      return Result<DependencyGraph, StageError>::Err(std::move(err));
    }
    if (unit.timeout_override_ms.has_value() && *unit.timeout_override_ms < 1) {
      auto err = StageError::Validation("Timeout override for unit '" + unit.id +
                                        "' must be >= 1");
      err.unit_id = unit.id;
      return Result<DependencyGraph, StageError>::Err(std::move(err));
    }

    // Drop repeated edges; order of first appearance is kept.
    std::vector<std::string> deps;
    std::unordered_set<std::string> seen;
    for (auto &dep : unit.depends_on) {
      if (dep == unit.id) {
        auto err = StageError::Validation("Work unit cannot depend on itself: " +
                                          unit.id);
        err.unit_id = unit.id;
        return Result<DependencyGraph, StageError>::Err(std::move(err));
      }
      if (seen.insert(dep).second) {
        deps.push_back(std::move(dep));
      }
    }
    unit.depends_on = std::move(deps);

    const std::string id = unit.id;
    if (!graph.units_.emplace(id, std::move(unit)).second) {
      auto err = StageError::Validation("Duplicate work unit id: " + id);
      err.unit_id = id;
      return Result<DependencyGraph, StageError>::Err(std::move(err));
    }
  }

  for (const auto &[id, unit] : graph.units_) {
    graph.dependents_[id];
    for (const auto &dep : unit.depends_on) {
      if (graph.units_.find(dep) == graph.units_.end()) {
        auto err = StageError::Validation("Unknown dependency '" + dep +
                                          "' declared by " + id);
        err.unit_id = id;
        err.details["dependency"] = dep;
        return Result<DependencyGraph, StageError>::Err(std::move(err));
      }
      graph.dependents_[dep].push_back(id);
    }
  }
  for (auto &[_, list] : graph.dependents_) {
    std::sort(list.begin(), list.end());
  }

  auto cycle = find_cycle(graph.units_);
  if (!cycle.empty()) {
    StageError err(ErrorKind::CycleDetected, ErrorCategory::Validation, 1002,
                   false,
                   "Dependency cycle detected: " + join_ids(cycle, " -> "),
                   {{"cycle", join_ids(cycle, ",")}});
    err.unit_id = cycle.front();
    return Result<DependencyGraph, StageError>::Err(std::move(err));
  }

  // Kahn's algorithm, one wave per round of zero in-degree removals.
  std::unordered_map<std::string, size_t> unmet;
  std::vector<std::string> current;
  for (const auto &[id, unit] : graph.units_) {
    unmet[id] = unit.depends_on.size();
    if (unit.depends_on.empty()) {
      current.push_back(id);
    }
  }

  auto by_priority = [&graph](const std::string &lhs, const std::string &rhs) {
    const int lp = graph.units_.at(lhs).priority;
    const int rp = graph.units_.at(rhs).priority;
    if (lp != rp) {
      return lp > rp;
    }
    return lhs < rhs;
  };

  int wave_index = 0;
  while (!current.empty()) {
    std::sort(current.begin(), current.end(), by_priority);

    std::vector<std::string> next;
    for (const auto &id : current) {
      graph.wave_index_[id] = wave_index;
      graph.topo_order_.push_back(id);
      for (const auto &succ : graph.dependents_[id]) {
        if (--unmet[succ] == 0) {
          next.push_back(succ);
        }
      }
    }

    graph.waves_.push_back(std::move(current));
    current = std::move(next);
    ++wave_index;
  }

  return Result<DependencyGraph, StageError>::Ok(std::move(graph));
}

bool DependencyGraph::contains(const std::string &id) const {
  return units_.find(id) != units_.end();
}

const WorkUnit *DependencyGraph::find(const std::string &id) const {
  auto it = units_.find(id);
  return it == units_.end() ? nullptr : &it->second;
}

int DependencyGraph::wave_of(const std::string &id) const {
  auto it = wave_index_.find(id);
  return it == wave_index_.end() ? -1 : it->second;
}

const std::vector<std::string> &
DependencyGraph::dependencies(const std::string &id) const {
  static const std::vector<std::string> kEmpty;
  auto it = units_.find(id);
  return it == units_.end() ? kEmpty : it->second.depends_on;
}

const std::vector<std::string> &
DependencyGraph::dependents(const std::string &id) const {
  static const std::vector<std::string> kEmpty;
  auto it = dependents_.find(id);
  return it == dependents_.end() ? kEmpty : it->second;
}

std::vector<std::string>
DependencyGraph::affected_by(const std::string &id) const {
  std::unordered_set<std::string> reached;
  std::vector<std::string> stack{id};
  while (!stack.empty()) {
    const auto current = stack.back();
    stack.pop_back();
    for (const auto &succ : dependents(current)) {
      if (reached.insert(succ).second) {
        stack.push_back(succ);
      }
    }
  }

  std::vector<std::string> ordered;
  ordered.reserve(reached.size());
  for (const auto &candidate : topo_order_) {
    if (reached.count(candidate) > 0) {
      ordered.push_back(candidate);
    }
  }
  return ordered;
}

std::vector<std::string> DependencyGraph::critical_path() const {
  std::unordered_map<std::string, double> best;
  std::unordered_map<std::string, std::string> via;

  std::string tail;
  double tail_cost = -1.0;
  for (const auto &id : topo_order_) {
    const auto &unit = units_.at(id);
    double upstream = 0.0;
    std::string from;
    for (const auto &dep : unit.depends_on) {
      const double candidate = best[dep];
      if (from.empty() || candidate > upstream) {
        upstream = candidate;
        from = dep;
      }
    }
    best[id] = upstream + cost_of(unit);
    if (!from.empty()) {
      via[id] = from;
    }
    if (best[id] > tail_cost) {
      tail_cost = best[id];
      tail = id;
    }
  }

  std::vector<std::string> path;
  for (std::string cursor = tail; !cursor.empty();) {
    path.push_back(cursor);
    auto it = via.find(cursor);
    cursor = it == via.end() ? std::string() : it->second;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

double DependencyGraph::critical_path_cost() const {
  double total = 0.0;
  for (const auto &id : critical_path()) {
    total += cost_of(units_.at(id));
  }
  return total;
}

} // namespace stagehand::core
