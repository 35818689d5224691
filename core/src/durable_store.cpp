#include "core/durable_store.h"

#include "core/work_unit.h"

#include <algorithm>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>

namespace stagehand::core {

namespace {

constexpr std::chrono::milliseconds kInitialPoll{2};
constexpr std::chrono::milliseconds kMaxPoll{50};

} // namespace

Result<Lock, StageError>
IDurableStore::acquire_lock(const std::string &key,
                            std::chrono::milliseconds ttl,
                            std::chrono::milliseconds timeout) {
  using Clock = std::chrono::steady_clock;
  const auto started = Clock::now();
  const auto deadline = started + timeout;
  const std::string token = generate_token();
  auto poll = kInitialPoll;

  while (true) {
    auto attempt = try_lock(key, token, ttl);
    if (attempt.is_err()) {
      return Result<Lock, StageError>::Err(attempt.error());
    }
    if (attempt.value()) {
      Lock lock;
      lock.key = key;
      lock.holder_token = token;
      lock.acquired_at_ms = now_epoch_ms();
      lock.ttl = ttl;
      return Result<Lock, StageError>::Ok(std::move(lock));
    }

    const auto now = Clock::now();
    if (now >= deadline) {
      const auto waited =
          std::chrono::duration_cast<std::chrono::milliseconds>(now - started);
      return Result<Lock, StageError>::Err(
          StageError::LockTimeout(key, waited.count()));
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(poll, remaining));
    poll = std::min(poll * 2, kMaxPoll);
  }
}

std::string generate_token() {
  static std::mutex mutex;
  static std::mt19937_64 gen{std::random_device{}()};

  uint64_t hi = 0;
  uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lock(mutex);
    hi = gen();
    lo = gen();
  }

  std::ostringstream ss;
  ss << std::hex << std::setfill('0') << std::setw(16) << hi << std::setw(16)
     << lo;
  return ss.str();
}

} // namespace stagehand::core
