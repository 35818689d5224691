#include <gtest/gtest.h>

#include "infra/logger.h"
#include "test_support.h"

#include <fstream>
#include <sstream>
#include <string>

using namespace stagehand::infra;
using stagehand::test_support::TempDir;

namespace {

std::string slurp(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

} // namespace

// ============================================================
// Test: File logger
// ============================================================

TEST(FileLogger, WritesStructuredLines) {
  TempDir dir("logger_file");
  const auto path = dir.path() / "run.log";
  {
    auto logger = create_file_logger(path.string(), "info");
    ASSERT_NE(logger, nullptr);
    logger->info("session-1", "engine", "run_start", "units=3");
    logger->warn("session-1", "engine", "unit_retry", "a attempt 1 failed");
  } // Dropping the logger flushes and closes the file.

  const std::string text = slurp(path);
  EXPECT_NE(text.find("[info] [session-1] [engine] run_start: units=3"),
            std::string::npos)
      << text;
  EXPECT_NE(text.find("[warning] [session-1] [engine] unit_retry: a attempt 1 failed"),
            std::string::npos)
      << text;
}

TEST(FileLogger, LevelFiltersLowerSeverities) {
  TempDir dir("logger_level");
  const auto path = dir.path() / "run.log";
  {
    auto logger = create_file_logger(path.string(), "warn");
    logger->debug("t", "engine", "claim_wait", "hidden");
    logger->info("t", "engine", "wave_start", "hidden");
    logger->error("t", "engine", "unit_failed", "shown");
  }

  const std::string text = slurp(path);
  EXPECT_EQ(text.find("hidden"), std::string::npos) << text;
  EXPECT_NE(text.find("unit_failed: shown"), std::string::npos) << text;
}

TEST(FileLogger, UnknownLevelFallsBackToInfo) {
  TempDir dir("logger_fallback");
  const auto path = dir.path() / "run.log";
  {
    auto logger = create_file_logger(path.string(), "chatty");
    logger->debug("t", "engine", "claim_wait", "hidden");
    logger->info("t", "engine", "run_finished", "shown");
  }

  const std::string text = slurp(path);
  EXPECT_EQ(text.find("hidden"), std::string::npos) << text;
  EXPECT_NE(text.find("run_finished: shown"), std::string::npos) << text;
}

TEST(FileLogger, AppendsToExistingFile) {
  TempDir dir("logger_append");
  const auto path = dir.path() / "run.log";
  std::ofstream(path) << "earlier line\n";
  {
    auto logger = create_file_logger(path.string());
    logger->info("t", "app", "store_ready", "memory");
  }

  const std::string text = slurp(path);
  EXPECT_EQ(text.rfind("earlier line\n", 0), 0u) << text;
  EXPECT_NE(text.find("store_ready: memory"), std::string::npos) << text;
}
