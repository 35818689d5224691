#pragma once

#include "core/durable_store.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace stagehand::infra {

/// In-process IDurableStore. Everything is lost with the process; useful
/// for single-process runs and tests.
class MemoryStore final : public core::IDurableStore {
public:
  /// Epoch milliseconds used for lock expiry. Defaults to the wall clock.
  using ClockFn = std::function<int64_t()>;

  explicit MemoryStore(ClockFn clock = {});

  core::Result<std::optional<std::string>, core::StageError>
  read(const std::string &key) override;

  core::Result<void, core::StageError> write(const std::string &key,
                                             const std::string &value) override;

  core::Result<std::vector<std::string>, core::StageError>
  list(const std::string &prefix) override;

  core::Result<void, core::StageError> remove(const std::string &key) override;

  core::Result<void, core::StageError>
  extend_lock(core::Lock &lock, std::chrono::milliseconds ttl) override;

  core::Result<void, core::StageError>
  release_lock(const core::Lock &lock) override;

protected:
  core::Result<bool, core::StageError>
  try_lock(const std::string &key, const std::string &token,
           std::chrono::milliseconds ttl) override;

private:
  struct LockEntry {
    std::string token;
    int64_t expires_at_ms = 0;
  };

  int64_t now() const;

  ClockFn clock_;
  std::mutex mutex_;
  std::map<std::string, std::string> data_;
  std::map<std::string, LockEntry> locks_;
};

} // namespace stagehand::infra
