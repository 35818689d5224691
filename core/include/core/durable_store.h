#pragma once

#include "core/result.h"
#include "core/stage_error.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stagehand::core {

/// A held (or formerly held) lock. Only the holder knows holder_token.
struct Lock {
  std::string key;
  std::string holder_token;
  int64_t acquired_at_ms = 0; // Wall clock, epoch milliseconds
  std::chrono::milliseconds ttl{0};
};

/// Abstract key/value persistence with an exclusive, TTL-bounded lock.
///
/// Guarantees every backend must give:
///   - write() is atomic per key: readers see the old or the new value,
///     never a torn one.
///   - list() returns matching keys in ascending order.
///   - At most one holder per lock key; a lock expires after its TTL even if
///     the holder died, after which another caller may take it over.
///
/// Lock keys live in their own namespace and never show up in list().
class IDurableStore {
public:
  virtual ~IDurableStore() = default;

  /// nullopt when the key does not exist.
  virtual Result<std::optional<std::string>, StageError>
  read(const std::string &key) = 0;

  virtual Result<void, StageError> write(const std::string &key,
                                         const std::string &value) = 0;

  virtual Result<std::vector<std::string>, StageError>
  list(const std::string &prefix) = 0;

  /// Removing a missing key is not an error.
  virtual Result<void, StageError> remove(const std::string &key) = 0;

  /// Block up to `timeout` for the lock on `key`.
  /// Fails with ErrorKind::LockTimeout when it stays contended.
  Result<Lock, StageError> acquire_lock(const std::string &key,
                                        std::chrono::milliseconds ttl,
                                        std::chrono::milliseconds timeout);

  /// Push the expiry of a held lock to now + ttl.
  /// Fails with ErrorKind::LockLost if the lock expired and was taken.
  virtual Result<void, StageError> extend_lock(Lock &lock,
                                               std::chrono::milliseconds ttl) = 0;

  /// Fails with ErrorKind::LockLost if `lock` is not held by its token.
  virtual Result<void, StageError> release_lock(const Lock &lock) = 0;

protected:
  /// Non-blocking attempt. Ok(true) when `token` now holds `key`; an expired
  /// holder must be replaced.
  virtual Result<bool, StageError> try_lock(const std::string &key,
                                            const std::string &token,
                                            std::chrono::milliseconds ttl) = 0;
};

/// Random 128-bit hex token for lock holders and engine instances.
std::string generate_token();

} // namespace stagehand::core
