#pragma once

#include "core/durable_store.h"

#include <filesystem>
#include <string>

namespace stagehand::infra {

/// IDurableStore on a local directory, shareable between processes.
///
/// Layout under `root`:
///   data/<encoded key>         one file per key, replaced via temp + rename
///   locks/<encoded key>.lock   created with O_EXCL, holds "token expiry_ms"
///
/// Keys are percent-encoded into flat file names, so list() is a single
/// directory scan. A lock whose expiry has passed is stolen by renaming it
/// aside first; the thief re-checks the token it renamed to avoid taking a
/// lock that was renewed in between. Renewal and release go through the
/// same rename-aside step, so a stolen lock file is never removed or
/// overwritten by its previous holder.
class FileStore final : public core::IDurableStore {
public:
  /// Creates the directory tree. Throws std::filesystem::filesystem_error
  /// when `root` cannot be created.
  explicit FileStore(std::filesystem::path root);

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

  /// Percent-encoding used for file names. Exposed for tests.
  static std::string encode_key(const std::string &key);
  static std::string decode_key(const std::string &name);

protected:
  core::Result<bool, core::StageError>
  try_lock(const std::string &key, const std::string &token,
           std::chrono::milliseconds ttl) override;

private:
  std::filesystem::path data_path(const std::string &key) const;
  std::filesystem::path lock_path(const std::string &key) const;

  /// Rename the lock file at `path` to `aside`. Ok(true) when it carried
  /// `token` (it stays at `aside`), Ok(false) when it was missing or held
  /// by someone else (it is put back).
  core::Result<bool, core::StageError>
  move_aside_if_held(const std::filesystem::path &path,
                     const std::filesystem::path &aside,
                     const std::string &token);

  std::filesystem::path root_;
  std::filesystem::path data_dir_;
  std::filesystem::path lock_dir_;
};

} // namespace stagehand::infra
