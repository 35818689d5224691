#include "core/session_repository.h"

#include "core/logger.h"

namespace stagehand::core {

namespace {

const std::string kSessionPrefix = "sessions/";
const std::string kLockPrefix = "session-locks/";

} // namespace

SessionRepository::SessionRepository(std::shared_ptr<IDurableStore> store,
                                     std::shared_ptr<ISessionCodec> codec,
                                     LockOptions lock_options,
                                     std::shared_ptr<ILogger> logger)
    : store_(std::move(store)), codec_(std::move(codec)),
      lock_options_(lock_options), logger_(std::move(logger)) {}

std::string SessionRepository::key_for(const std::string &session_id) {
  return kSessionPrefix + session_id;
}

std::string SessionRepository::lock_key_for(const std::string &session_id) {
  return kLockPrefix + session_id;
}

Result<std::optional<Session>, StageError>
SessionRepository::load(const std::string &session_id) {
  auto raw = store_->read(key_for(session_id));
  if (raw.is_err()) {
    return Result<std::optional<Session>, StageError>::Err(raw.error());
  }
  if (!raw.value().has_value()) {
    return Result<std::optional<Session>, StageError>::Ok(std::nullopt);
  }

  auto decoded = codec_->decode(*raw.value());
  if (decoded.is_err()) {
    return Result<std::optional<Session>, StageError>::Err(decoded.error());
  }
  return Result<std::optional<Session>, StageError>::Ok(
      std::move(decoded).value());
}

Result<Session, StageError>
SessionRepository::update(const std::string &session_id,
                          const Mutator &mutator) {
  auto acquired = store_->acquire_lock(
      lock_key_for(session_id), std::chrono::milliseconds(lock_options_.ttl_ms),
      std::chrono::milliseconds(lock_options_.timeout_ms));
  if (acquired.is_err()) {
    if (logger_) {
      logger_->warn(session_id, "session", "lock_unavailable",
                    acquired.error().message);
    }
    return Result<Session, StageError>::Err(acquired.error());
  }
  const Lock lock = std::move(acquired).value();

  auto result = [&]() -> Result<Session, StageError> {
    auto latest = load(session_id);
    if (latest.is_err()) {
      return Result<Session, StageError>::Err(latest.error());
    }

    const bool existed = latest.value().has_value();
    Session session;
    if (existed) {
      session = std::move(*latest.value());
    } else {
      session.session_id = session_id;
      session.created_at_ms = now_epoch_ms();
    }

    auto mutated = mutator(session, existed);
    if (mutated.is_err()) {
      return Result<Session, StageError>::Err(mutated.error());
    }

    session.revision += 1;
    session.updated_at_ms = now_epoch_ms();

    auto written = store_->write(key_for(session_id), codec_->encode(session));
    if (written.is_err()) {
      return Result<Session, StageError>::Err(written.error());
    }
    return Result<Session, StageError>::Ok(std::move(session));
  }();

  auto released = store_->release_lock(lock);
  if (released.is_err()) {
    // The write happened while we held the lock; an expiry between write
    // and release is only worth a warning.
    if (logger_) {
      logger_->warn(session_id, "session", "lock_release_failed",
                    released.error().message);
    }
  }
  return result;
}

Result<std::vector<std::string>, StageError> SessionRepository::list_ids() {
  auto keys = store_->list(kSessionPrefix);
  if (keys.is_err()) {
    return keys;
  }

  std::vector<std::string> ids;
  ids.reserve(keys.value().size());
  for (const auto &key : keys.value()) {
    ids.push_back(key.substr(kSessionPrefix.size()));
  }
  return Result<std::vector<std::string>, StageError>::Ok(std::move(ids));
}

Result<void, StageError> SessionRepository::remove(const std::string &session_id) {
  return store_->remove(key_for(session_id));
}

} // namespace stagehand::core
