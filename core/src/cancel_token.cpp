#include "core/cancel_token.h"

namespace stagehand::core {

void CancelToken::request_cancel() noexcept {
  bool expected = false;
  if (!canceled_.compare_exchange_strong(expected, true,
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
    return;
  }

  // First cancellation: wake waiters, then run callbacks outside the lock
  // so a callback may cancel other tokens.
  std::vector<Callback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks.swap(callbacks_);
  }
  cv_.notify_all();

  for (auto &cb : callbacks) {
    if (cb) {
      try {
        cb();
      } catch (...) { /* swallow, cancel must not throw */
      }
    }
  }
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return is_canceled(); });
}

void CancelToken::on_cancel(Callback cb) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_canceled()) {
      callbacks_.push_back(std::move(cb));
      return;
    }
  }
  // Already canceled: invoke immediately
  if (cb) {
    cb();
  }
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

std::shared_ptr<CancelToken>
CancelToken::create_child(const std::shared_ptr<CancelToken> &parent) {
  auto child = create();
  if (parent) {
    std::weak_ptr<CancelToken> weak = child;
    parent->on_cancel([weak]() {
      if (auto token = weak.lock()) {
        token->request_cancel();
      }
    });
  }
  return child;
}

} // namespace stagehand::core
