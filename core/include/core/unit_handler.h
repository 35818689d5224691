#pragma once

#include "core/cancel_token.h"
#include "core/result.h"
#include "core/stage_error.h"
#include "core/work_unit.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stagehand::core {

/// Context passed to a handler for one attempt of one unit.
/// Carries inputs/outputs and the attempt's cancel token.
struct UnitContext {
  std::string session_id;
  std::string unit_id;
  int attempt = 1; // 1-based
  std::shared_ptr<CancelToken> cancel_token;

  /// Outputs of the unit's succeeded dependencies, merged in dependency
  /// order (later dependencies win on key clashes).
  std::map<std::string, std::string> inputs;

  /// Key-value outputs produced by this unit. Persisted with the Session.
  std::map<std::string, std::string> outputs;

  /// Convenience: get input or return default.
  [[nodiscard]] std::string get_input(const std::string &key,
                                      std::string default_val = {}) const {
    auto it = inputs.find(key);
    return it == inputs.end() ? std::move(default_val) : it->second;
  }

  void set_output(const std::string &key, std::string value) {
    outputs[key] = std::move(value);
  }

  [[nodiscard]] bool is_canceled() const {
    return cancel_token && cancel_token->is_canceled();
  }
};

/// Performs the work behind one unit kind.
///
/// Must be safe to call concurrently for independent units, must poll
/// ctx.cancel_token at reasonable intervals and tolerate being abandoned
/// once it has been canceled. Failures are returned classified
/// (StageError::category / retryable) so the engine can decide on retries.
class IUnitHandler {
public:
  virtual ~IUnitHandler() = default;

  /// Human-readable name for logging.
  [[nodiscard]] virtual std::string name() const = 0;

  virtual Result<void, StageError> execute(const WorkUnit &unit,
                                           UnitContext &ctx) = 0;
};

/// Maps WorkUnit::kind to the handler that runs it.
class HandlerRegistry {
public:
  using HandlerFn =
      std::function<Result<void, StageError>(const WorkUnit &, UnitContext &)>;

  void register_handler(const std::string &kind,
                        std::shared_ptr<IUnitHandler> handler);

  /// Wrap a plain function as a handler for `kind`.
  void register_function(const std::string &kind, HandlerFn fn);

  /// nullptr when no handler is registered for `kind`.
  [[nodiscard]] std::shared_ptr<IUnitHandler> find(const std::string &kind) const;

private:
  std::map<std::string, std::shared_ptr<IUnitHandler>> handlers_;
};

} // namespace stagehand::core
