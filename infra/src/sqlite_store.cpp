#include "infra/sqlite_store.h"

#include "core/work_unit.h"

#include <sqlite3.h>

#include <stdexcept>

namespace stagehand::infra {

using core::Result;
using core::StageError;

namespace {

void throw_if(int rc, sqlite3 *db, const char *what) {
  if (rc != SQLITE_OK) {
    throw SqliteError(rc & 0xFF, std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

/// Prepared statement, finalized on scope exit.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) : db_(db) {
    throw_if(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_,
             "sqlite prepare");
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  void bind_text(int index, const std::string &value) {
    throw_if(sqlite3_bind_text(stmt_, index, value.data(),
                               static_cast<int>(value.size()), SQLITE_TRANSIENT),
             db_, "sqlite bind");
  }

  void bind_blob(int index, const std::string &value) {
    throw_if(sqlite3_bind_blob(stmt_, index, value.data(),
                               static_cast<int>(value.size()), SQLITE_TRANSIENT),
             db_, "sqlite bind");
  }

  void bind_int64(int index, int64_t value) {
    throw_if(sqlite3_bind_int64(stmt_, index, value), db_, "sqlite bind");
  }

  /// true while rows are produced, false once done.
  bool step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw SqliteError(rc & 0xFF,
                      std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

  std::string column_bytes(int column) {
    const auto *data = static_cast<const char *>(sqlite3_column_blob(stmt_, column));
    const int size = sqlite3_column_bytes(stmt_, column);
    return data ? std::string(data, static_cast<size_t>(size)) : std::string();
  }

  int64_t column_int64(int column) { return sqlite3_column_int64(stmt_, column); }

private:
  sqlite3 *db_;
  sqlite3_stmt *stmt_ = nullptr;
};

/// BEGIN IMMEDIATE: takes the write lock up front. Rolled back unless
/// committed.
class Transaction {
public:
  explicit Transaction(SqliteDb &db) : db_(db) { db_.exec("BEGIN IMMEDIATE;"); }

  ~Transaction() {
    if (!finished_) {
      sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    }
  }

  void commit() {
    db_.exec("COMMIT;");
    finished_ = true;
  }

private:
  SqliteDb &db_;
  bool finished_ = false;
};

constexpr const char *kSchema = R"sql(
CREATE TABLE IF NOT EXISTS kv (
  key   TEXT PRIMARY KEY,
  value BLOB NOT NULL
);
CREATE TABLE IF NOT EXISTS locks (
  key           TEXT PRIMARY KEY,
  token         TEXT NOT NULL,
  expires_at_ms INTEGER NOT NULL
);
)sql";

} // namespace

// ============================================================================
// SqliteDb
// ============================================================================

SqliteDb::SqliteDb(std::string path, int busy_timeout_ms)
    : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(
      path_.c_str(), &db_,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
      nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    throw SqliteError(rc & 0xFF, "Cannot open '" + path_ + "': " + msg);
  }
  configure(busy_timeout_ms);
}

SqliteDb::~SqliteDb() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteDb::exec(const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw SqliteError(rc & 0xFF, msg);
  }
}

void SqliteDb::configure(int busy_timeout_ms) {
  // WAL: readers proceed while one writer holds the lock.
  exec("PRAGMA journal_mode=WAL;");
  exec("PRAGMA synchronous=NORMAL;");
  throw_if(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");
  exec("PRAGMA temp_store=MEMORY;");
}

// ============================================================================
// SqliteStore
// ============================================================================

SqliteStore::SqliteStore(const std::string &path, int busy_timeout_ms)
    : db_(std::make_unique<SqliteDb>(path, busy_timeout_ms)) {
  db_->exec(kSchema);
}

Result<std::optional<std::string>, StageError>
SqliteStore::read(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Statement stmt(db_->handle(), "SELECT value FROM kv WHERE key = ?1;");
    stmt.bind_text(1, key);
    if (!stmt.step()) {
      return Result<std::optional<std::string>, StageError>::Ok(std::nullopt);
    }
    return Result<std::optional<std::string>, StageError>::Ok(
        stmt.column_bytes(0));
  } catch (const std::exception &e) {
    return Result<std::optional<std::string>, StageError>::Err(
        StageError::Store(std::string("read failed: ") + e.what()));
  }
}

Result<void, StageError> SqliteStore::write(const std::string &key,
                                            const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Statement stmt(db_->handle(),
                   "INSERT OR REPLACE INTO kv (key, value) VALUES (?1, ?2);");
    stmt.bind_text(1, key);
    stmt.bind_blob(2, value);
    stmt.step();
    return Result<void, StageError>::Ok();
  } catch (const std::exception &e) {
    return Result<void, StageError>::Err(
        StageError::Store(std::string("write failed: ") + e.what()));
  }
}

Result<std::vector<std::string>, StageError>
SqliteStore::list(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Statement stmt(db_->handle(),
                   "SELECT key FROM kv WHERE substr(key, 1, length(?1)) = ?1 "
                   "ORDER BY key;");
    stmt.bind_text(1, prefix);
    std::vector<std::string> keys;
    while (stmt.step()) {
      keys.push_back(stmt.column_bytes(0));
    }
    return Result<std::vector<std::string>, StageError>::Ok(std::move(keys));
  } catch (const std::exception &e) {
    return Result<std::vector<std::string>, StageError>::Err(
        StageError::Store(std::string("list failed: ") + e.what()));
  }
}

Result<void, StageError> SqliteStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Statement stmt(db_->handle(), "DELETE FROM kv WHERE key = ?1;");
    stmt.bind_text(1, key);
    stmt.step();
    return Result<void, StageError>::Ok();
  } catch (const std::exception &e) {
    return Result<void, StageError>::Err(
        StageError::Store(std::string("remove failed: ") + e.what()));
  }
}

Result<bool, StageError> SqliteStore::try_lock(const std::string &key,
                                               const std::string &token,
                                               std::chrono::milliseconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Transaction tx(*db_);
    const int64_t now = core::now_epoch_ms();
    {
      Statement holder(db_->handle(),
                       "SELECT expires_at_ms FROM locks WHERE key = ?1;");
      holder.bind_text(1, key);
      if (holder.step() && holder.column_int64(0) > now) {
        return Result<bool, StageError>::Ok(false);
      }
    }
    {
      Statement take(db_->handle(),
                     "INSERT OR REPLACE INTO locks (key, token, expires_at_ms) "
                     "VALUES (?1, ?2, ?3);");
      take.bind_text(1, key);
      take.bind_text(2, token);
      take.bind_int64(3, now + ttl.count());
      take.step();
    }
    tx.commit();
    return Result<bool, StageError>::Ok(true);
  } catch (const SqliteError &e) {
    // Another connection kept the write lock past the busy timeout: the
    // lock is contended, not broken. acquire_lock() keeps polling.
    if (e.code() == SQLITE_BUSY || e.code() == SQLITE_LOCKED) {
      return Result<bool, StageError>::Ok(false);
    }
    return Result<bool, StageError>::Err(
        StageError::Store(std::string("lock failed: ") + e.what()));
  } catch (const std::exception &e) {
    return Result<bool, StageError>::Err(
        StageError::Store(std::string("lock failed: ") + e.what()));
  }
}

Result<void, StageError> SqliteStore::extend_lock(core::Lock &held,
                                                  std::chrono::milliseconds ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Statement stmt(db_->handle(),
                   "UPDATE locks SET expires_at_ms = ?3 "
                   "WHERE key = ?1 AND token = ?2;");
    stmt.bind_text(1, held.key);
    stmt.bind_text(2, held.holder_token);
    stmt.bind_int64(3, core::now_epoch_ms() + ttl.count());
    stmt.step();
    if (sqlite3_changes(db_->handle()) == 0) {
      return Result<void, StageError>::Err(StageError::LockLost(held.key));
    }
    held.ttl = ttl;
    return Result<void, StageError>::Ok();
  } catch (const std::exception &e) {
    return Result<void, StageError>::Err(
        StageError::Store(std::string("extend lock failed: ") + e.what()));
  }
}

Result<void, StageError> SqliteStore::release_lock(const core::Lock &held) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Statement stmt(db_->handle(),
                   "DELETE FROM locks WHERE key = ?1 AND token = ?2;");
    stmt.bind_text(1, held.key);
    stmt.bind_text(2, held.holder_token);
    stmt.step();
    if (sqlite3_changes(db_->handle()) == 0) {
      return Result<void, StageError>::Err(StageError::LockLost(held.key));
    }
    return Result<void, StageError>::Ok();
  } catch (const std::exception &e) {
    return Result<void, StageError>::Err(
        StageError::Store(std::string("release lock failed: ") + e.what()));
  }
}

} // namespace stagehand::infra
