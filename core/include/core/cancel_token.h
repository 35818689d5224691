#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace stagehand::core {

/// Thread-safe cancellation token.
///
/// Design: single-writer (whoever calls request_cancel()) / multi-reader
/// (handlers check is_canceled()). Tokens form a tree: canceling a parent
/// cancels every child created from it, a child never cancels its parent.
///
/// Usage in unit handlers:
///   Result<void, StageError> execute(const WorkUnit &u, UnitContext &ctx) {
///       for (int i = 0; i < N; ++i) {
///           if (ctx.cancel_token->is_canceled())
///               return Result<void, StageError>::Err(StageError::Canceled());
///           // ... do work ...
///       }
///   }
class CancelToken {
public:
  CancelToken() = default;

  /// Request cancellation. Thread-safe, idempotent.
  void request_cancel() noexcept;

  /// Check if cancellation has been requested.
  [[nodiscard]] bool is_canceled() const noexcept;

  /// Block for up to `timeout` or until canceled.
  /// Returns true if the token was canceled.
  bool wait_for(std::chrono::milliseconds timeout) const;

  /// Register a callback to be invoked when cancellation is requested.
  /// Callbacks are invoked synchronously from request_cancel(), or
  /// immediately if the token is already canceled.
  using Callback = std::function<void()>;
  void on_cancel(Callback cb);

  /// Create a shared CancelToken.
  static std::shared_ptr<CancelToken> create();

  /// Create a token that is canceled whenever `parent` is.
  static std::shared_ptr<CancelToken>
  create_child(const std::shared_ptr<CancelToken> &parent);

private:
  std::atomic<bool> canceled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::vector<Callback> callbacks_;
};

} // namespace stagehand::core
