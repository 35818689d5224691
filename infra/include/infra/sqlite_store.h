#pragma once

#include "core/durable_store.h"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

struct sqlite3;

namespace stagehand::infra {

/// Failure reported by SQLite, with its primary result code.
class SqliteError : public std::runtime_error {
public:
  SqliteError(int code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  [[nodiscard]] int code() const { return code_; }

private:
  int code_;
};

/// RAII sqlite3 connection. Opened FULLMUTEX in WAL mode with a busy
/// timeout so several processes can share one database file.
/// Throws SqliteError on open or statement failures.
class SqliteDb {
public:
  explicit SqliteDb(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDb();

  SqliteDb(const SqliteDb &) = delete;
  SqliteDb &operator=(const SqliteDb &) = delete;

  void exec(const std::string &sql);
  [[nodiscard]] sqlite3 *handle() const { return db_; }

private:
  void configure(int busy_timeout_ms);

  std::string path_;
  sqlite3 *db_ = nullptr;
};

/// IDurableStore on a SQLite database: a `kv` table for values and a
/// `locks` table of (key, token, expires_at_ms). Locks are taken inside
/// BEGIN IMMEDIATE, so the check-then-insert is atomic across processes.
class SqliteStore final : public core::IDurableStore {
public:
  /// Opens (creating if needed) the database and its schema.
  /// Throws SqliteError when the database cannot be opened.
  explicit SqliteStore(const std::string &path, int busy_timeout_ms = 5000);

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
  std::unique_ptr<SqliteDb> db_;
  // One connection: statements and transactions must not interleave.
  std::mutex mutex_;
};

} // namespace stagehand::infra
