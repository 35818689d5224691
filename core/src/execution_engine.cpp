#include "core/execution_engine.h"

#include "core/cancel_token.h"
#include "core/dependency_graph.h"
#include "core/logger.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <random>
#include <sstream>
#include <thread>
#include <utility>

namespace stagehand::core {

namespace {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

constexpr const char *kComponent = "engine";
constexpr std::chrono::milliseconds kClaimPollInterval{50};

std::string join_ids(const std::vector<std::string> &ids) {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty()) {
      out += ",";
    }
    out += id;
  }
  return out;
}

/// Shared between the engine and the thread running one attempt. The
/// engine may walk away on a deadline; the thread keeps this alive.
struct AttemptState {
  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  std::optional<StageError> error;
  UnitContext ctx;
};

/// One persisted state change of one unit.
struct Transition {
  std::string unit_id;
  UnitStatus status = UnitStatus::Pending;
  std::string message;
  /// Owned transitions require this engine's running claim on the unit.
  /// Unowned ones only touch units nobody has claimed yet.
  bool owned = true;
  int attempt = 0;
  std::optional<StageError> error;
  std::map<std::string, std::string> outputs;
  bool applied = false;
};

} // namespace

// ============================================================================
// Options
// ============================================================================

Result<void, StageError> validate(const EngineOptions &options) {
  if (options.global_concurrency < 1) {
    return Result<void, StageError>::Err(
        StageError::Validation("global_concurrency must be >= 1"));
  }
  if (options.per_unit_timeout_ms < 1) {
    return Result<void, StageError>::Err(
        StageError::Validation("per_unit_timeout_ms must be >= 1"));
  }
  for (const auto &[kind, timeout_ms] : options.kind_timeout_ms) {
    if (timeout_ms < 1) {
      return Result<void, StageError>::Err(StageError::Validation(
          "Timeout override for kind '" + kind + "' must be >= 1"));
    }
  }
  if (options.whole_run_timeout_ms < 0) {
    return Result<void, StageError>::Err(
        StageError::Validation("whole_run_timeout_ms must be >= 0"));
  }
  if (options.min_success_ratio < 0.0 || options.min_success_ratio > 1.0) {
    return Result<void, StageError>::Err(
        StageError::Validation("min_success_ratio must be within [0, 1]"));
  }
  if (options.claim_stale_after_ms < 0) {
    return Result<void, StageError>::Err(
        StageError::Validation("claim_stale_after_ms must be >= 0"));
  }
  auto breaker = validate(options.circuit_breaker);
  if (breaker.is_err()) {
    return breaker;
  }
  return validate(options.retry);
}

// ============================================================================
// Run: state of a single ExecutionEngine::run() call
// ============================================================================

class ExecutionEngine::Run {
public:
  Run(ExecutionEngine &engine, DependencyGraph graph, EngineOptions options,
      std::vector<EventCallback> callbacks)
      : engine_(engine), graph_(std::move(graph)), options_(std::move(options)),
        callbacks_(std::move(callbacks)),
        breakers_(options_.circuit_breaker, engine.breaker_clock_),
        retry_(options_.retry), run_token_(CancelToken::create()),
        rng_(std::random_device{}()) {
    ids_ = graph_.topological_order();
  }

  Result<RunReport, StageError> execute() {
    started_ = Clock::now();
    if (options_.whole_run_timeout_ms > 0) {
      run_deadline_ =
          started_ + std::chrono::milliseconds(options_.whole_run_timeout_ms);
    }

    auto opened = initialize();
    if (opened.is_err()) {
      log_error("run_open_failed", opened.error().message);
      return Result<RunReport, StageError>::Err(opened.error());
    }
    log_info("run_start", "units=" + std::to_string(graph_.size()) +
                              " waves=" + std::to_string(graph_.waves().size()) +
                              " concurrency=" +
                              std::to_string(options_.global_concurrency));

    const auto &waves = graph_.waves();
    for (size_t w = 0; w < waves.size(); ++w) {
      check_run_deadline();
      run_wave(static_cast<int>(w), waves[w]);
      checkpoint();
    }

    join_orphans();
    return Result<RunReport, StageError>::Ok(finalize());
  }

  /// Caller-requested cancel.
  void cancel() {
    external_cancel_ = true;
    abort(StageError::Canceled("Run canceled by caller"));
    run_token_->request_cancel();
  }

private:
  using Mutation =
      std::function<void(Session &, bool existed, int64_t now_ms,
                         std::vector<ProgressEvent> &events)>;

  // ---- Session persistence ----

  /// Locked read-modify-write of the Session. Statistics are recounted over
  /// this run's units, the local mirror is refreshed and the new events are
  /// delivered to subscribers in sequence order.
  Result<void, StageError> persist(const Mutation &mutation) {
    std::lock_guard<std::mutex> commit_lock(commit_mutex_);
    std::vector<ProgressEvent> events;
    auto written = engine_.sessions_->update(
        session_id(), [&](Session &session, bool existed) {
          events.clear();
          mutation(session, existed, now_epoch_ms(), events);
          session.recompute_statistics(ids_);
          return Result<void, StageError>::Ok();
        });
    if (written.is_err()) {
      return Result<void, StageError>::Err(written.error());
    }
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      mirror_ = std::move(written).value();
    }
    for (const auto &event : events) {
      for (const auto &cb : callbacks_) {
        notify(cb, event);
      }
    }
    return Result<void, StageError>::Ok();
  }

  /// Subscribers run on worker threads: a throwing one is logged, never
  /// allowed to unwind into the engine.
  void notify(const EventCallback &cb, const ProgressEvent &event) {
    try {
      cb(session_id(), event);
    } catch (const std::exception &e) {
      log_warn("callback_failed", "event " + std::to_string(event.seq) +
                                      " subscriber threw: " + e.what());
    } catch (...) {
      log_warn("callback_failed", "event " + std::to_string(event.seq) +
                                      " subscriber threw a non-standard exception");
    }
  }

  /// Apply a batch of unit transitions. A store failure aborts the run.
  bool commit(std::vector<Transition> &transitions, int retry_delta = 0,
              int rejection_delta = 0) {
    auto persisted = persist([&](Session &session, bool, int64_t now_ms,
                                 std::vector<ProgressEvent> &events) {
      session.statistics.retries += retry_delta;
      session.statistics.circuit_rejections += rejection_delta;
      for (auto &t : transitions) {
        t.applied = apply_transition(session, t, now_ms, events);
      }
    });
    if (persisted.is_err()) {
      log_error("session_write_failed", persisted.error().message);
      abort(persisted.error());
      run_token_->request_cancel();
      return false;
    }
    return true;
  }

  bool apply_transition(Session &session, const Transition &t, int64_t now_ms,
                        std::vector<ProgressEvent> &events) {
    auto it = session.unit_states.find(t.unit_id);
    if (it == session.unit_states.end()) {
      return false;
    }
    ExecutionState &state = it->second;

    if (t.owned) {
      if (state.status != UnitStatus::Running ||
          state.owner != engine_.instance_id_) {
        log_warn("claim_lost", t.unit_id + " is now held by '" + state.owner +
                                   "' (" + to_string(state.status) + ")");
        return false;
      }
    } else if (state.status != UnitStatus::Pending &&
               state.status != UnitStatus::Blocked &&
               state.status != UnitStatus::Ready) {
      return false;
    }

    if (t.status != state.status) {
      auto moved = state.transition_to(t.status, now_ms);
      if (moved.is_err()) {
        log_warn("illegal_transition", moved.error().message);
        return false;
      }
    }
    if (t.attempt > 0) {
      state.attempt_count = t.attempt;
    }
    if (t.error.has_value()) {
      state.last_error = t.error;
    }
    if (t.status == UnitStatus::Running) {
      state.heartbeat_at_ms = now_ms;
    }
    if (t.status == UnitStatus::Succeeded) {
      state.outputs = t.outputs;
    }
    if (is_terminal(t.status)) {
      state.owner.clear();
      state.heartbeat_at_ms.reset();
    }
    events.push_back(session.append_event(t.unit_id, to_string(t.status),
                                          state.attempt_count, t.message,
                                          now_ms));
    return true;
  }

  Result<void, StageError> initialize() {
    return persist([&](Session &session, bool existed, int64_t now_ms,
                       std::vector<ProgressEvent> &events) {
      if (existed && session.overall_status != RunStatus::Running) {
        session.statistics.retries = 0;
        session.statistics.circuit_rejections = 0;
        session.statistics.total_duration_ms = 0;
        session.last_error.reset();
      }
      // Joining a run another engine is still driving: its terminal
      // results stand, only unclaimed work is picked up.
      const bool joining = existed && has_live_foreign_claim(session, now_ms);
      if (joining) {
        log_info("run_join", "session is live on another engine");
      }

      for (const auto &id : ids_) {
        const WorkUnit *unit = graph_.find(id);
        const UnitStatus initial = unit->depends_on.empty()
                                       ? UnitStatus::Pending
                                       : UnitStatus::Blocked;
        auto it = session.unit_states.find(id);
        if (it == session.unit_states.end()) {
          ExecutionState state;
          if (initial == UnitStatus::Blocked) {
            (void)state.transition_to(UnitStatus::Blocked, now_ms);
          }
          session.unit_states.emplace(id, std::move(state));
          continue;
        }
        // Succeeded units are kept, running claims are settled by claim().
        ExecutionState &state = it->second;
        if (!joining && (state.status == UnitStatus::Failed ||
                         state.status == UnitStatus::Skipped)) {
          (void)state.transition_to(initial, now_ms);
        }
      }

      session.overall_status = RunStatus::Running;
      events.push_back(session.append_event(
          "", to_string(RunStatus::Running), 0,
          existed ? "run resumed" : "run started", now_ms));
    });
  }

  /// A Running session with a fresh claim held by another engine. Final
  /// sessions, and Running ones whose every claim went stale, are resumed.
  bool has_live_foreign_claim(const Session &session, int64_t now_ms) const {
    if (session.overall_status != RunStatus::Running) {
      return false;
    }
    for (const auto &[id, state] : session.unit_states) {
      if (state.status != UnitStatus::Running ||
          state.owner == engine_.instance_id_) {
        continue;
      }
      const WorkUnit *unit = graph_.find(id);
      if (unit == nullptr || !claim_is_stale(state, *unit, now_ms)) {
        return true;
      }
    }
    return false;
  }

  void checkpoint() {
    auto persisted = persist(
        [](Session &, bool, int64_t, std::vector<ProgressEvent> &) {});
    if (persisted.is_err()) {
      log_error("checkpoint_failed", persisted.error().message);
      abort(persisted.error());
    }
  }

  // ---- Waves ----

  void run_wave(int index, const std::vector<std::string> &wave) {
    std::vector<std::string> candidates;
    std::vector<Transition> skips;

    for (const auto &id : wave) {
      const ExecutionState state = state_of(id);
      if (is_terminal(state.status)) {
        continue;
      }
      if (aborted()) {
        skips.push_back(skip_transition(id, abort_message()));
        continue;
      }
      std::string blocking;
      for (const auto &dep : graph_.dependencies(id)) {
        if (state_of(dep).status != UnitStatus::Succeeded) {
          blocking = dep;
          break;
        }
      }
      if (!blocking.empty()) {
        skips.push_back(skip_transition(
            id, "dependency " + blocking + " is " +
                    to_string(state_of(blocking).status)));
        continue;
      }
      candidates.push_back(id);
    }

    if (!skips.empty() && !commit(skips)) {
      return;
    }
    if (candidates.empty()) {
      return;
    }

    const int workers =
        std::min<int>(options_.global_concurrency,
                      static_cast<int>(candidates.size()));
    log_info("wave_start", "wave=" + std::to_string(index) +
                               " units=" + std::to_string(candidates.size()) +
                               " workers=" + std::to_string(workers));

    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(workers));
    for (int i = 0; i < workers; ++i) {
      pool.emplace_back([this, &next, &candidates]() {
        while (true) {
          const size_t slot = next.fetch_add(1);
          if (slot >= candidates.size()) {
            return;
          }
          process_unit(candidates[slot]);
        }
      });
    }
    for (auto &t : pool) {
      t.join();
    }
  }

  // ---- One unit ----

  enum class ClaimOutcome { Claimed, Settled, Wait };

  void process_unit(const std::string &id) {
    while (true) {
      if (aborted()) {
        std::vector<Transition> skip{skip_transition(id, abort_message())};
        commit(skip);
        return;
      }

      ClaimOutcome outcome = ClaimOutcome::Settled;
      auto persisted = persist([&](Session &session, bool, int64_t now_ms,
                                   std::vector<ProgressEvent> &events) {
        outcome = claim(session, id, now_ms, events);
      });
      if (persisted.is_err()) {
        log_error("claim_failed", id + ": " + persisted.error().message);
        abort(persisted.error());
        run_token_->request_cancel();
        return;
      }

      if (outcome == ClaimOutcome::Settled) {
        settle_adopted(id);
        return;
      }
      if (outcome == ClaimOutcome::Wait) {
        wait_for_foreign_claim(id);
        continue;
      }
      if (run_claimed(id)) {
        return;
      }
    }
  }

  ClaimOutcome claim(Session &session, const std::string &id, int64_t now_ms,
                     std::vector<ProgressEvent> &events) {
    ExecutionState &state = session.unit_states[id];
    if (is_terminal(state.status)) {
      // Another engine finished it in the meantime.
      return ClaimOutcome::Settled;
    }

    if (state.status == UnitStatus::Running) {
      if (state.owner != engine_.instance_id_ &&
          !claim_is_stale(state, *graph_.find(id), now_ms)) {
        return ClaimOutcome::Wait;
      }
      const std::string previous_owner = state.owner;
      (void)state.transition_to(UnitStatus::Ready, now_ms);
      events.push_back(session.append_event(
          id, to_string(UnitStatus::Ready), state.attempt_count,
          "stale claim of '" + previous_owner + "' taken over", now_ms));
    } else {
      (void)state.transition_to(UnitStatus::Ready, now_ms);
      events.push_back(session.append_event(id, to_string(UnitStatus::Ready),
                                            0, "dependencies satisfied",
                                            now_ms));
    }

    (void)state.transition_to(UnitStatus::Running, now_ms);
    state.owner = engine_.instance_id_;
    state.attempt_count = 1;
    state.heartbeat_at_ms = now_ms;
    events.push_back(session.append_event(id, to_string(UnitStatus::Running),
                                          1, "attempt 1 started", now_ms));
    return ClaimOutcome::Claimed;
  }

  /// A unit finished by another engine still counts for escalation here.
  void settle_adopted(const std::string &id) {
    const ExecutionState state = state_of(id);
    log_debug("claim_adopted", id + " finished elsewhere as " +
                                   to_string(state.status));
    if (state.status == UnitStatus::Failed && is_required(id)) {
      StageError critical(ErrorKind::CriticalStageFailure,
                          ErrorCategory::Pipeline, 2005, false,
                          "Required unit '" + id + "' failed on another engine");
      critical.unit_id = id;
      critical.attempts = state.attempt_count;
      abort(std::move(critical));
    }
  }

  bool claim_is_stale(const ExecutionState &state, const WorkUnit &unit,
                      int64_t now_ms) const {
    if (!state.heartbeat_at_ms.has_value()) {
      return true;
    }
    int64_t stale_after = options_.claim_stale_after_ms;
    if (stale_after == 0) {
      stale_after = static_cast<int64_t>(timeout_for(unit)) +
                    options_.retry.max_delay_ms +
                    engine_.sessions_->lock_options().ttl_ms;
    }
    return now_ms - *state.heartbeat_at_ms >= stale_after;
  }

  /// Poll unlocked snapshots until the foreign claim resolves or goes stale.
  void wait_for_foreign_claim(const std::string &id) {
    log_debug("claim_wait", id + " is running on another engine");
    const WorkUnit &unit = *graph_.find(id);
    while (!aborted()) {
      if (run_token_->wait_for(kClaimPollInterval)) {
        return;
      }
      check_run_deadline();

      auto snapshot = engine_.sessions_->load(session_id());
      if (snapshot.is_err() || !snapshot.value().has_value()) {
        return;
      }
      const auto &units = snapshot.value()->unit_states;
      auto it = units.find(id);
      if (it == units.end() || it->second.status != UnitStatus::Running ||
          claim_is_stale(it->second, unit, now_epoch_ms())) {
        return;
      }
    }
  }

  /// Attempt loop for a claimed unit. Returns false when the claim was lost
  /// to another engine and the caller should wait for its outcome instead.
  bool run_claimed(const std::string &id) {
    const WorkUnit &unit = *graph_.find(id);
    auto handler = engine_.handlers_.find(unit.kind);
    CircuitBreaker &breaker = breakers_.for_kind(unit.kind);
    const auto inputs = collect_inputs(unit);

    int attempt = 1;
    while (true) {
      if (aborted()) {
        std::vector<Transition> skip{skip_transition(id, abort_message(), true)};
        commit(skip);
        return true;
      }

      if (!breaker.allow_request()) {
        StageError error = StageError::CircuitOpen(unit.kind);
        error.unit_id = id;
        error.attempts = attempt;
        log_warn("circuit_open",
                 id + " rejected, retry in " +
                     std::to_string(breaker.remaining_open_ms()) + "ms");
        return fail_unit(id, error, 1);
      }

      auto outcome = execute_attempt(unit, handler, attempt, inputs);
      if (outcome.run_aborted) {
        std::vector<Transition> skip{skip_transition(id, abort_message(), true)};
        commit(skip);
        return true;
      }

      if (!outcome.error.has_value()) {
        breaker.record_success();
        std::vector<Transition> done(1);
        done[0].unit_id = id;
        done[0].status = UnitStatus::Succeeded;
        done[0].message = "attempt " + std::to_string(attempt) + " succeeded";
        done[0].attempt = attempt;
        done[0].outputs = std::move(outcome.outputs);
        if (!commit(done)) {
          return true;
        }
        log_debug("unit_succeeded", id + " attempts=" + std::to_string(attempt));
        return done[0].applied;
      }

      breaker.record_failure();
      StageError error = std::move(*outcome.error);
      error.unit_id = id;
      error.attempts = attempt;

      const RetryDecision decision =
          retry_.decide(attempt, error, jitter_sample());
      if (decision.action == RetryAction::GiveUp) {
        return fail_unit(id, error, 0);
      }

      log_info("unit_retry", id + " attempt " + std::to_string(attempt) +
                                 " failed (" + error.message + "), retrying in " +
                                 std::to_string(decision.delay.count()) + "ms");
      std::vector<Transition> retry(1);
      retry[0].unit_id = id;
      retry[0].status = UnitStatus::Running;
      retry[0].message = "attempt " + std::to_string(attempt) + " failed: " +
                         error.message + "; retrying in " +
                         std::to_string(decision.delay.count()) + "ms";
      retry[0].attempt = attempt;
      retry[0].error = error;
      if (!commit(retry, 1)) {
        return true;
      }
      if (!retry[0].applied) {
        return false;
      }

      wait_backoff(decision.delay);
      if (aborted()) {
        continue;
      }

      ++attempt;
      std::vector<Transition> next(1);
      next[0].unit_id = id;
      next[0].status = UnitStatus::Running;
      next[0].message = "attempt " + std::to_string(attempt) + " started";
      next[0].attempt = attempt;
      if (!commit(next)) {
        return true;
      }
      if (!next[0].applied) {
        return false;
      }
    }
  }

  struct AttemptOutcome {
    std::optional<StageError> error;
    std::map<std::string, std::string> outputs;
    bool run_aborted = false;
  };

  AttemptOutcome execute_attempt(const WorkUnit &unit,
                                 const std::shared_ptr<IUnitHandler> &handler,
                                 int attempt,
                                 const std::map<std::string, std::string> &inputs) {
    auto token = CancelToken::create_child(run_token_);
    auto state = std::make_shared<AttemptState>();
    state->ctx.session_id = session_id();
    state->ctx.unit_id = unit.id;
    state->ctx.attempt = attempt;
    state->ctx.cancel_token = token;
    state->ctx.inputs = inputs;

    std::weak_ptr<AttemptState> weak = state;
    token->on_cancel([weak]() {
      if (auto s = weak.lock()) {
        std::lock_guard<std::mutex> lock(s->mutex);
        s->cv.notify_all();
      }
    });

    std::thread worker([state, handler, unit]() {
      std::optional<StageError> failure;
      try {
        auto result = handler->execute(unit, state->ctx);
        if (result.is_err()) {
          failure = result.error();
        }
      } catch (const std::exception &e) {
        failure = StageError::Internal(std::string("Handler threw: ") + e.what());
      }
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->done = true;
        state->error = std::move(failure);
      }
      state->cv.notify_all();
    });

    const int timeout_ms = timeout_for(unit);
    TimePoint deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    bool run_bound = false;
    if (run_deadline_.has_value() && *run_deadline_ < deadline) {
      deadline = *run_deadline_;
      run_bound = true;
    }

    AttemptOutcome outcome;
    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait_until(lock, deadline, [&]() {
      return state->done || token->is_canceled();
    });

    if (state->done) {
      outcome.error = state->error;
      outcome.outputs = state->ctx.outputs;
      lock.unlock();
      worker.join();
      if (outcome.error.has_value() && run_token_->is_canceled()) {
        outcome.run_aborted = true;
      }
      return outcome;
    }
    lock.unlock();

    // The handler missed its deadline or the run was canceled: fire its
    // token and abandon it. The thread is joined before run() returns.
    token->request_cancel();
    adopt_orphan(std::move(worker));

    if (run_token_->is_canceled()) {
      outcome.run_aborted = true;
    } else if (run_bound) {
      trigger_run_timeout();
      outcome.run_aborted = true;
    } else {
      log_warn("unit_timeout", unit.id + " attempt " + std::to_string(attempt) +
                                   " exceeded " + std::to_string(timeout_ms) +
                                   "ms");
      outcome.error = StageError::Timeout(unit.id, timeout_ms);
    }
    return outcome;
  }

  /// Terminal failure: record it, skip everything downstream and escalate
  /// when the unit is required.
  bool fail_unit(const std::string &id, const StageError &error,
                 int rejection_delta) {
    std::vector<Transition> transitions(1);
    transitions[0].unit_id = id;
    transitions[0].status = UnitStatus::Failed;
    transitions[0].message = error.message;
    transitions[0].attempt = error.attempts;
    transitions[0].error = error;
    for (const auto &dependent : graph_.affected_by(id)) {
      transitions.push_back(
          skip_transition(dependent, "dependency " + id + " failed"));
    }
    if (!commit(transitions, 0, rejection_delta)) {
      return true;
    }
    if (!transitions[0].applied) {
      return false;
    }

    log_error("unit_failed", id + " after " + std::to_string(error.attempts) +
                                 " attempt(s): [" + to_string(error.kind) +
                                 "] " + error.message);

    if (is_required(id)) {
      StageError critical(ErrorKind::CriticalStageFailure, error.category, 2005,
                          false, "Required unit '" + id + "' failed: " +
                                     error.message,
                          {{"cause", to_string(error.kind)}});
      critical.unit_id = id;
      critical.attempts = error.attempts;
      abort(std::move(critical));
    }
    return true;
  }

  // ---- Helpers ----

  Transition skip_transition(const std::string &id, std::string message,
                             bool owned = false) const {
    Transition t;
    t.unit_id = id;
    t.status = UnitStatus::Skipped;
    t.message = std::move(message);
    t.owned = owned;
    return t;
  }

  std::map<std::string, std::string> collect_inputs(const WorkUnit &unit) {
    std::map<std::string, std::string> inputs;
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto &dep : unit.depends_on) {
      auto it = mirror_.unit_states.find(dep);
      if (it == mirror_.unit_states.end()) {
        continue;
      }
      for (const auto &[key, value] : it->second.outputs) {
        inputs[key] = value;
      }
    }
    return inputs;
  }

  ExecutionState state_of(const std::string &id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = mirror_.unit_states.find(id);
    return it == mirror_.unit_states.end() ? ExecutionState{} : it->second;
  }

  int timeout_for(const WorkUnit &unit) const {
    if (unit.timeout_override_ms.has_value()) {
      return *unit.timeout_override_ms;
    }
    auto it = options_.kind_timeout_ms.find(unit.kind);
    if (it != options_.kind_timeout_ms.end()) {
      return it->second;
    }
    return options_.per_unit_timeout_ms;
  }

  bool is_required(const std::string &id) const {
    if (options_.required_unit_ids.count(id) > 0) {
      return true;
    }
    return options_.fail_fast && options_.required_unit_ids.empty();
  }

  double jitter_sample() {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
  }

  void wait_backoff(std::chrono::milliseconds delay) {
    if (run_deadline_.has_value()) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          *run_deadline_ - Clock::now());
      delay = std::max(std::chrono::milliseconds(0), std::min(delay, remaining));
    }
    run_token_->wait_for(delay);
    check_run_deadline();
  }

  void check_run_deadline() {
    if (run_deadline_.has_value() && Clock::now() >= *run_deadline_) {
      trigger_run_timeout();
    }
  }

  void trigger_run_timeout() {
    std::vector<std::string> pending;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      for (const auto &id : ids_) {
        auto it = mirror_.unit_states.find(id);
        if (it == mirror_.unit_states.end() || !is_terminal(it->second.status)) {
          pending.push_back(id);
        }
      }
    }
    StageError error(ErrorKind::ParallelExecutionTimeout,
                     ErrorCategory::Timeout, 2006, false,
                     "Run exceeded its deadline of " +
                         std::to_string(options_.whole_run_timeout_ms) + "ms",
                     {{"pending", join_ids(pending)},
                      {"timeout_ms",
                       std::to_string(options_.whole_run_timeout_ms)}});
    abort(std::move(error));
    run_token_->request_cancel();
  }

  void abort(StageError error) {
    {
      std::lock_guard<std::mutex> lock(abort_mutex_);
      if (abort_error_.has_value()) {
        return;
      }
      log_warn("run_abort", std::string("[") + to_string(error.kind) + "] " +
                                error.message);
      abort_error_ = std::move(error);
    }
    aborted_ = true;
  }

  bool aborted() const { return aborted_.load(); }

  std::string abort_message() {
    std::lock_guard<std::mutex> lock(abort_mutex_);
    return abort_error_.has_value() ? "run aborted: " + abort_error_->message
                                    : "run aborted";
  }

  void adopt_orphan(std::thread thread) {
    std::lock_guard<std::mutex> lock(orphan_mutex_);
    orphans_.push_back(std::move(thread));
  }

  void join_orphans() {
    std::vector<std::thread> orphans;
    {
      std::lock_guard<std::mutex> lock(orphan_mutex_);
      orphans.swap(orphans_);
    }
    for (auto &t : orphans) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  // ---- Finalization ----

  RunReport finalize() {
    const int64_t elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                              started_)
            .count();

    std::optional<StageError> run_error;
    {
      std::lock_guard<std::mutex> lock(abort_mutex_);
      run_error = abort_error_;
    }

    RunStatus overall = RunStatus::Completed;
    if (external_cancel_) {
      overall = RunStatus::Aborted;
    } else if (run_error.has_value()) {
      overall = RunStatus::Failed;
    }

    auto persisted = persist([&](Session &session, bool, int64_t now_ms,
                                 std::vector<ProgressEvent> &events) {
      // Whatever never ran is skipped once the run stops early.
      for (const auto &id : ids_) {
        auto &state = session.unit_states[id];
        if (state.status == UnitStatus::Pending ||
            state.status == UnitStatus::Blocked ||
            state.status == UnitStatus::Ready) {
          (void)state.transition_to(UnitStatus::Skipped, now_ms);
          events.push_back(session.append_event(
              id, to_string(UnitStatus::Skipped), state.attempt_count,
              run_error.has_value() ? "run aborted: " + run_error->message
                                    : "run finished before dispatch",
              now_ms));
        }
      }
      session.recompute_statistics(ids_);

      if (!run_error.has_value()) {
        const SessionStatistics &stats = session.statistics;
        const double ratio =
            stats.total == 0 ? 1.0
                             : static_cast<double>(stats.succeeded) / stats.total;
        if (stats.succeeded == stats.total) {
          overall = RunStatus::Completed;
        } else if (options_.allow_partial_results &&
                   ratio >= options_.min_success_ratio) {
          overall = RunStatus::Partial;
        } else {
          overall = RunStatus::Failed;
          run_error = summary_error(session, ratio);
        }
      }

      session.overall_status = overall;
      session.last_error = run_error;
      session.statistics.total_duration_ms = elapsed_ms;
      events.push_back(session.append_event(
          "", to_string(overall), 0,
          run_error.has_value() ? run_error->message : "run finished", now_ms));
    });
    if (persisted.is_err()) {
      // Report from the last state we saw; the store already failed us.
      log_error("finalize_failed", persisted.error().message);
      if (!run_error.has_value()) {
        run_error = persisted.error();
      }
      overall = external_cancel_ ? RunStatus::Aborted : RunStatus::Failed;
    }

    RunReport report = build_report(overall, run_error, elapsed_ms);
    const std::string summary =
        std::string("status=") + to_string(overall) +
        " succeeded=" + std::to_string(report.statistics.succeeded) +
        " failed=" + std::to_string(report.statistics.failed) +
        " skipped=" + std::to_string(report.statistics.skipped) +
        " retries=" + std::to_string(report.statistics.retries) +
        " duration_ms=" + std::to_string(elapsed_ms);
    if (overall == RunStatus::Completed || overall == RunStatus::Partial) {
      log_info("run_finished", summary);
    } else {
      log_error("run_finished", summary + (run_error.has_value()
                                               ? " error=" + run_error->message
                                               : std::string()));
    }
    return report;
  }

  StageError summary_error(const Session &session, double ratio) const {
    std::string first_failed;
    for (const auto &id : ids_) {
      auto it = session.unit_states.find(id);
      if (it != session.unit_states.end() &&
          it->second.status == UnitStatus::Failed) {
        first_failed = id;
        break;
      }
    }

    const auto &stats = session.statistics;
    std::ostringstream msg;
    if (options_.allow_partial_results) {
      msg << "Only " << stats.succeeded << " of " << stats.total
          << " units succeeded (ratio " << ratio << " < required "
          << options_.min_success_ratio << ")";
      StageError error(ErrorKind::InsufficientPartialResults,
                       ErrorCategory::Pipeline, 2007, false, msg.str(),
                       {{"succeeded", std::to_string(stats.succeeded)},
                        {"total", std::to_string(stats.total)}});
      error.unit_id = first_failed;
      return error;
    }

    msg << stats.failed << " unit(s) failed, " << stats.skipped
        << " skipped";
    StageError error = StageError::Execution(msg.str());
    error.unit_id = first_failed;
    error.details["failed"] = std::to_string(stats.failed);
    error.details["skipped"] = std::to_string(stats.skipped);
    return error;
  }

  RunReport build_report(RunStatus overall,
                         const std::optional<StageError> &run_error,
                         int64_t elapsed_ms) {
    RunReport report;
    report.session_id = session_id();
    report.overall_status = overall;
    report.waves = graph_.waves();
    report.critical_path = graph_.critical_path();
    report.error = run_error;

    std::lock_guard<std::mutex> lock(state_mutex_);
    report.statistics = mirror_.statistics;
    report.statistics.total_duration_ms = elapsed_ms;
    for (const auto &id : ids_) {
      const WorkUnit *unit = graph_.find(id);
      UnitReport entry;
      entry.id = id;
      entry.kind = unit->kind;
      auto it = mirror_.unit_states.find(id);
      if (it != mirror_.unit_states.end()) {
        const ExecutionState &state = it->second;
        entry.status = state.status;
        entry.attempts = state.attempt_count;
        entry.duration_ms = state.duration_ms();
        if (state.status == UnitStatus::Failed) {
          entry.error = state.last_error;
        }
      }
      report.per_unit.push_back(std::move(entry));
    }
    return report;
  }

  // ---- Logging ----

  const std::string &session_id() const { return options_.session_id; }

  void log_debug(const std::string &event, const std::string &msg) {
    if (engine_.logger_) {
      engine_.logger_->debug(session_id(), kComponent, event, msg);
    }
  }
  void log_info(const std::string &event, const std::string &msg) {
    if (engine_.logger_) {
      engine_.logger_->info(session_id(), kComponent, event, msg);
    }
  }
  void log_warn(const std::string &event, const std::string &msg) {
    if (engine_.logger_) {
      engine_.logger_->warn(session_id(), kComponent, event, msg);
    }
  }
  void log_error(const std::string &event, const std::string &msg) {
    if (engine_.logger_) {
      engine_.logger_->error(session_id(), kComponent, event, msg);
    }
  }

  ExecutionEngine &engine_;
  DependencyGraph graph_;
  EngineOptions options_;
  std::vector<EventCallback> callbacks_;
  std::vector<std::string> ids_;

  CircuitBreakerRegistry breakers_;
  RetryPolicy retry_;
  std::shared_ptr<CancelToken> run_token_;

  TimePoint started_;
  std::optional<TimePoint> run_deadline_;

  std::mutex commit_mutex_;
  std::mutex state_mutex_;
  Session mirror_;

  std::mutex abort_mutex_;
  std::optional<StageError> abort_error_;
  std::atomic<bool> aborted_{false};
  std::atomic<bool> external_cancel_{false};

  std::mutex orphan_mutex_;
  std::vector<std::thread> orphans_;

  std::mutex rng_mutex_;
  std::mt19937_64 rng_;
};

// ============================================================================
// ExecutionEngine
// ============================================================================

ExecutionEngine::ExecutionEngine(std::shared_ptr<SessionRepository> sessions,
                                 HandlerRegistry handlers,
                                 std::shared_ptr<ILogger> logger,
                                 CircuitBreaker::ClockFn breaker_clock)
    : sessions_(std::move(sessions)), handlers_(std::move(handlers)),
      logger_(std::move(logger)), breaker_clock_(std::move(breaker_clock)),
      instance_id_("engine-" + generate_token().substr(0, 12)) {}

ExecutionEngine::~ExecutionEngine() = default;

Result<RunReport, StageError>
ExecutionEngine::run(std::vector<WorkUnit> units, const EngineOptions &options) {
  if (running_.exchange(true)) {
    return Result<RunReport, StageError>::Err(StageError::Validation(
        "A run is already in progress on this engine instance"));
  }
  struct RunningGuard {
    std::atomic<bool> &flag;
    ~RunningGuard() { flag = false; }
  } running_guard{running_};

  auto valid = validate(options);
  if (valid.is_err()) {
    return Result<RunReport, StageError>::Err(valid.error());
  }
  if (!sessions_) {
    return Result<RunReport, StageError>::Err(
        StageError::Internal("ExecutionEngine requires a SessionRepository"));
  }

  auto built = DependencyGraph::build(std::move(units));
  if (built.is_err()) {
    if (logger_) {
      logger_->error(options.session_id, kComponent, "graph_invalid",
                     built.error().message);
    }
    return Result<RunReport, StageError>::Err(built.error());
  }
  DependencyGraph graph = std::move(built).value();

  for (const auto &id : graph.topological_order()) {
    const WorkUnit *unit = graph.find(id);
    if (!handlers_.find(unit->kind)) {
      StageError error = StageError::Validation(
          "No handler registered for kind '" + unit->kind + "'");
      error.unit_id = id;
      error.details["kind"] = unit->kind;
      return Result<RunReport, StageError>::Err(std::move(error));
    }
  }
  for (const auto &id : options.required_unit_ids) {
    if (!graph.contains(id)) {
      StageError error =
          StageError::Validation("Required unit '" + id + "' is not defined");
      error.unit_id = id;
      return Result<RunReport, StageError>::Err(std::move(error));
    }
  }

  EngineOptions effective = options;
  if (effective.session_id.empty()) {
    effective.session_id = "session-" + generate_token().substr(0, 16);
  }

  std::shared_ptr<Run> active;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active = std::make_shared<Run>(*this, std::move(graph), std::move(effective),
                                   callbacks_);
    active_run_ = active;
  }

  auto result = active->execute();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_run_.reset();
  }
  return result;
}

void ExecutionEngine::cancel() {
  std::shared_ptr<Run> active;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active = active_run_;
  }
  if (active) {
    active->cancel();
  }
}

void ExecutionEngine::on_event(EventCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(cb));
}

} // namespace stagehand::core
