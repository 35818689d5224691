#pragma once

#include "core/logger.h"

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace stagehand::test_support {

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string &tag) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("stagehand_" + tag + "_" + std::to_string(::getpid()) +
             "_" + std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

/// Logger that keeps every event name, for asserting on what was logged.
class RecordingLogger final : public core::ILogger {
public:
  void debug(const std::string &, const std::string &, const std::string &event,
             const std::string &) override {
    record(event);
  }
  void info(const std::string &, const std::string &, const std::string &event,
            const std::string &) override {
    record(event);
  }
  void warn(const std::string &, const std::string &, const std::string &event,
            const std::string &) override {
    record(event);
  }
  void error(const std::string &, const std::string &, const std::string &event,
             const std::string &) override {
    record(event);
  }

  [[nodiscard]] bool saw(const std::string &event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &e : events_) {
      if (e == event) {
        return true;
      }
    }
    return false;
  }

private:
  void record(const std::string &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  mutable std::mutex mutex_;
  std::vector<std::string> events_;
};

} // namespace stagehand::test_support
