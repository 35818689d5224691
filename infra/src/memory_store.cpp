#include "infra/memory_store.h"

#include "core/work_unit.h"

namespace stagehand::infra {

using core::Result;
using core::StageError;

MemoryStore::MemoryStore(ClockFn clock) : clock_(std::move(clock)) {}

int64_t MemoryStore::now() const {
  return clock_ ? clock_() : core::now_epoch_ms();
}

Result<std::optional<std::string>, StageError>
MemoryStore::read(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = data_.find(key);
  if (it == data_.end()) {
    return Result<std::optional<std::string>, StageError>::Ok(std::nullopt);
  }
  return Result<std::optional<std::string>, StageError>::Ok(it->second);
}

Result<void, StageError> MemoryStore::write(const std::string &key,
                                            const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_[key] = value;
  return Result<void, StageError>::Ok();
}

Result<std::vector<std::string>, StageError>
MemoryStore::list(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = data_.lower_bound(prefix); it != data_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    keys.push_back(it->first);
  }
  return Result<std::vector<std::string>, StageError>::Ok(std::move(keys));
}

Result<void, StageError> MemoryStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_.erase(key);
  return Result<void, StageError>::Ok();
}

Result<bool, StageError> MemoryStore::try_lock(const std::string &key,
                                               const std::string &token,
                                               std::chrono::milliseconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t current = now();
  auto it = locks_.find(key);
  if (it != locks_.end() && it->second.expires_at_ms > current) {
    return Result<bool, StageError>::Ok(false);
  }
  locks_[key] = LockEntry{token, current + ttl.count()};
  return Result<bool, StageError>::Ok(true);
}

Result<void, StageError> MemoryStore::extend_lock(core::Lock &held,
                                                  std::chrono::milliseconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = locks_.find(held.key);
  if (it == locks_.end() || it->second.token != held.holder_token) {
    return Result<void, StageError>::Err(StageError::LockLost(held.key));
  }
  it->second.expires_at_ms = now() + ttl.count();
  held.ttl = ttl;
  return Result<void, StageError>::Ok();
}

Result<void, StageError> MemoryStore::release_lock(const core::Lock &held) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = locks_.find(held.key);
  if (it == locks_.end() || it->second.token != held.holder_token) {
    return Result<void, StageError>::Err(StageError::LockLost(held.key));
  }
  locks_.erase(it);
  return Result<void, StageError>::Ok();
}

} // namespace stagehand::infra
