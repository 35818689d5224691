#pragma once

#include "core/durable_store.h"
#include "core/result.h"
#include "core/session.h"
#include "core/stage_error.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stagehand::core {

class ILogger;

struct LockOptions {
  int ttl_ms = 30000;
  int timeout_ms = 5000;
};

/// Session persistence on top of an IDurableStore.
///
/// Every mutation is read-lock-write-release: update() takes the session's
/// lock, re-reads the latest persisted copy, applies the mutator and writes
/// the result back before releasing. Concurrent writers (threads or
/// processes sharing the store) therefore never lose each other's changes.
class SessionRepository {
public:
  /// Mutator invoked with the latest Session (freshly created when absent).
  /// `existed` tells whether it was loaded from the store. Returning Err
  /// aborts the update without writing.
  using Mutator = std::function<Result<void, StageError>(Session &, bool existed)>;

  SessionRepository(std::shared_ptr<IDurableStore> store,
                    std::shared_ptr<ISessionCodec> codec,
                    LockOptions lock_options = {},
                    std::shared_ptr<ILogger> logger = nullptr);

  static std::string key_for(const std::string &session_id);
  static std::string lock_key_for(const std::string &session_id);

  /// Unlocked snapshot read; nullopt when the session does not exist.
  Result<std::optional<Session>, StageError> load(const std::string &session_id);

  /// Locked read-modify-write. Returns the Session as written.
  Result<Session, StageError> update(const std::string &session_id,
                                     const Mutator &mutator);

  /// Ids of every persisted session, ascending.
  Result<std::vector<std::string>, StageError> list_ids();

  Result<void, StageError> remove(const std::string &session_id);

  [[nodiscard]] const LockOptions &lock_options() const { return lock_options_; }

private:
  std::shared_ptr<IDurableStore> store_;
  std::shared_ptr<ISessionCodec> codec_;
  LockOptions lock_options_;
  std::shared_ptr<ILogger> logger_;
};

} // namespace stagehand::core
