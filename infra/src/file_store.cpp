#include "infra/file_store.h"

#include "core/work_unit.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace stagehand::infra {

using core::Result;
using core::StageError;

namespace fs = std::filesystem;

namespace {

struct LockFileContent {
  std::string token;
  int64_t expires_at_ms = 0;
};

std::string errno_message(const std::string &what, const fs::path &path) {
  return what + " '" + path.string() + "': " + std::strerror(errno);
}

std::string format_lock(const std::string &token, int64_t expires_at_ms) {
  return token + " " + std::to_string(expires_at_ms) + "\n";
}

/// nullopt when the file is missing or not (yet) fully written.
std::optional<LockFileContent> read_lock_file(const fs::path &path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  LockFileContent content;
  if (!(in >> content.token >> content.expires_at_ms)) {
    return std::nullopt;
  }
  return content;
}

std::optional<int64_t> modified_at_ms(const fs::path &path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }
  return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 +
         st.st_mtim.tv_nsec / 1000000;
}

bool write_all(int fd, const std::string &data) {
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

/// Write `data` to a hidden temp file in `dir`, then rename it over `target`.
Result<void, StageError> replace_file(const fs::path &dir,
                                      const fs::path &target,
                                      const std::string &data) {
  const fs::path tmp = dir / ("." + core::generate_token() + ".tmp");
  const int fd = ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0) {
    return Result<void, StageError>::Err(
        StageError::Store(errno_message("Cannot create", tmp)));
  }
  const bool ok = write_all(fd, data) && ::fsync(fd) == 0;
  const std::string failure = ok ? std::string() : errno_message("Cannot write", tmp);
  ::close(fd);
  if (!ok) {
    ::unlink(tmp.c_str());
    return Result<void, StageError>::Err(StageError::Store(failure));
  }
  if (::rename(tmp.c_str(), target.c_str()) != 0) {
    const std::string msg = errno_message("Cannot rename into", target);
    ::unlink(tmp.c_str());
    return Result<void, StageError>::Err(StageError::Store(msg));
  }
  return Result<void, StageError>::Ok();
}

} // namespace

FileStore::FileStore(fs::path root)
    : root_(std::move(root)), data_dir_(root_ / "data"),
      lock_dir_(root_ / "locks") {
  fs::create_directories(data_dir_);
  fs::create_directories(lock_dir_);
}

std::string FileStore::encode_key(const std::string &key) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(key.size());
  for (const unsigned char c : key) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
        (c >= '0' && c <= '9') || c == '-' || c == '_') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string FileStore::decode_key(const std::string &name) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'A' && c <= 'F') {
      return c - 'A' + 10;
    }
    if (c >= 'a' && c <= 'f') {
      return c - 'a' + 10;
    }
    return -1;
  };

  std::string out;
  out.reserve(name.size());
  for (size_t i = 0; i < name.size(); ++i) {
    if (name[i] == '%' && i + 2 < name.size()) {
      const int hi = hex(name[i + 1]);
      const int lo = hex(name[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(name[i]);
  }
  return out;
}

fs::path FileStore::data_path(const std::string &key) const {
  return data_dir_ / encode_key(key);
}

fs::path FileStore::lock_path(const std::string &key) const {
  return lock_dir_ / (encode_key(key) + ".lock");
}

Result<std::optional<std::string>, StageError>
FileStore::read(const std::string &key) {
  const fs::path path = data_path(key);
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      return Result<std::optional<std::string>, StageError>::Ok(std::nullopt);
    }
    return Result<std::optional<std::string>, StageError>::Err(
        StageError::Store("Cannot open '" + path.string() + "' for reading"));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Result<std::optional<std::string>, StageError>::Ok(buffer.str());
}

Result<void, StageError> FileStore::write(const std::string &key,
                                          const std::string &value) {
  return replace_file(data_dir_, data_path(key), value);
}

Result<std::vector<std::string>, StageError>
FileStore::list(const std::string &prefix) {
  std::error_code ec;
  fs::directory_iterator it(data_dir_, ec);
  if (ec) {
    return Result<std::vector<std::string>, StageError>::Err(StageError::Store(
        "Cannot list '" + data_dir_.string() + "': " + ec.message()));
  }

  std::vector<std::string> keys;
  for (const auto &entry : it) {
    const std::string name = entry.path().filename().string();
    if (name.empty() || name[0] == '.') {
      continue; // In-flight temp file
    }
    std::string key = decode_key(name);
    if (key.compare(0, prefix.size(), prefix) == 0) {
      keys.push_back(std::move(key));
    }
  }
  std::sort(keys.begin(), keys.end());
  return Result<std::vector<std::string>, StageError>::Ok(std::move(keys));
}

Result<void, StageError> FileStore::remove(const std::string &key) {
  std::error_code ec;
  fs::remove(data_path(key), ec);
  if (ec) {
    return Result<void, StageError>::Err(
        StageError::Store("Cannot remove key '" + key + "': " + ec.message()));
  }
  return Result<void, StageError>::Ok();
}

Result<bool, StageError> FileStore::try_lock(const std::string &key,
                                             const std::string &token,
                                             std::chrono::milliseconds ttl) {
  const fs::path path = lock_path(key);

  for (int round = 0; round < 2; ++round) {
    const int fd =
        ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd >= 0) {
      const bool ok =
          write_all(fd, format_lock(token, core::now_epoch_ms() + ttl.count()));
      ::close(fd);
      if (!ok) {
        const std::string msg = errno_message("Cannot write lock", path);
        ::unlink(path.c_str());
        return Result<bool, StageError>::Err(StageError::Store(msg));
      }
      return Result<bool, StageError>::Ok(true);
    }
    if (errno != EEXIST) {
      return Result<bool, StageError>::Err(
          StageError::Store(errno_message("Cannot create lock", path)));
    }
    if (round == 1) {
      break;
    }

    // Held: steal it only once it has expired.
    const auto holder = read_lock_file(path);
    const int64_t now = core::now_epoch_ms();
    bool expired = false;
    if (holder.has_value()) {
      expired = holder->expires_at_ms <= now;
    } else {
      // Being written right now, or its writer died half-way.
      const auto mtime = modified_at_ms(path);
      if (!mtime.has_value()) {
        continue; // Released meanwhile
      }
      expired = now - *mtime > ttl.count();
    }
    if (!expired) {
      return Result<bool, StageError>::Ok(false);
    }

    const fs::path stale = lock_dir_ / ("." + core::generate_token() + ".stale");
    if (::rename(path.c_str(), stale.c_str()) != 0) {
      continue; // Someone else moved it first
    }
    const auto moved = read_lock_file(stale);
    const bool same = holder.has_value()
                          ? (moved.has_value() && moved->token == holder->token)
                          : !moved.has_value();
    if (!same) {
      // A renewed lock was moved aside: put it back unless replaced already.
      const bool restored =
          ::link(stale.c_str(), path.c_str()) == 0 || errno == EEXIST;
      const std::string msg = errno_message("Cannot restore lock", path);
      ::unlink(stale.c_str());
      if (!restored) {
        return Result<bool, StageError>::Err(StageError::Store(msg));
      }
      return Result<bool, StageError>::Ok(false);
    }
    ::unlink(stale.c_str());
  }
  return Result<bool, StageError>::Ok(false);
}

Result<bool, StageError> FileStore::move_aside_if_held(const fs::path &path,
                                                       const fs::path &aside,
                                                       const std::string &token) {
  if (::rename(path.c_str(), aside.c_str()) != 0) {
    if (errno == ENOENT) {
      return Result<bool, StageError>::Ok(false);
    }
    return Result<bool, StageError>::Err(
        StageError::Store(errno_message("Cannot move lock", path)));
  }
  const auto moved = read_lock_file(aside);
  if (moved.has_value() && moved->token == token) {
    return Result<bool, StageError>::Ok(true);
  }
  // Taken over by someone else: put it back unless replaced already.
  const bool restored =
      ::link(aside.c_str(), path.c_str()) == 0 || errno == EEXIST;
  const std::string msg = errno_message("Cannot restore lock", path);
  ::unlink(aside.c_str());
  if (!restored) {
    return Result<bool, StageError>::Err(StageError::Store(msg));
  }
  return Result<bool, StageError>::Ok(false);
}

Result<void, StageError> FileStore::extend_lock(core::Lock &lock,
                                                std::chrono::milliseconds ttl) {
  const fs::path path = lock_path(lock.key);

  // Renewed content is staged first, then linked into place: link() fails
  // instead of clobbering a lock someone created meanwhile.
  const fs::path staged = lock_dir_ / ("." + core::generate_token() + ".renew");
  auto written = replace_file(
      lock_dir_, staged,
      format_lock(lock.holder_token, core::now_epoch_ms() + ttl.count()));
  if (written.is_err()) {
    return written;
  }

  const fs::path aside = lock_dir_ / ("." + core::generate_token() + ".held");
  auto held = move_aside_if_held(path, aside, lock.holder_token);
  if (held.is_err() || !held.value()) {
    ::unlink(staged.c_str());
    if (held.is_err()) {
      return Result<void, StageError>::Err(held.error());
    }
    return Result<void, StageError>::Err(StageError::LockLost(lock.key));
  }

  const bool linked = ::link(staged.c_str(), path.c_str()) == 0;
  const int link_errno = errno;
  ::unlink(staged.c_str());
  ::unlink(aside.c_str());
  if (!linked) {
    if (link_errno == EEXIST) {
      // Grabbed in the window while ours was moved aside.
      return Result<void, StageError>::Err(StageError::LockLost(lock.key));
    }
    errno = link_errno;
    return Result<void, StageError>::Err(
        StageError::Store(errno_message("Cannot renew lock", path)));
  }
  lock.ttl = ttl;
  return Result<void, StageError>::Ok();
}

Result<void, StageError> FileStore::release_lock(const core::Lock &lock) {
  const fs::path path = lock_path(lock.key);
  const fs::path aside = lock_dir_ / ("." + core::generate_token() + ".released");
  auto held = move_aside_if_held(path, aside, lock.holder_token);
  if (held.is_err()) {
    return Result<void, StageError>::Err(held.error());
  }
  if (!held.value()) {
    return Result<void, StageError>::Err(StageError::LockLost(lock.key));
  }
  if (::unlink(aside.c_str()) != 0 && errno != ENOENT) {
    return Result<void, StageError>::Err(
        StageError::Store(errno_message("Cannot remove lock", aside)));
  }
  return Result<void, StageError>::Ok();
}

} // namespace stagehand::infra
