#include <gtest/gtest.h>

#include "infra/config.h"
#include "infra/memory_store.h"
#include "infra/store_factory.h"
#include "test_support.h"

#include <cstdlib>
#include <fstream>
#include <string>

using namespace stagehand::infra;
using stagehand::core::ErrorKind;
using stagehand::test_support::RecordingLogger;
using stagehand::test_support::TempDir;

namespace {

/// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  const char *name_;
};

const char *const kFullConfig = R"(
session_id: nightly
global_concurrency: 8
fail_fast: true
allow_partial_results: true
min_success_ratio: 0.6
log_level: debug
required_unit_ids: [fetch, publish]
timeouts:
  per_unit_ms: 1500
  whole_run_ms: 60000
  claim_stale_ms: 9000
  per_kind:
    render: 2500
circuit_breaker:
  failure_threshold: 2
  reset_timeout_ms: 100
  half_open_max_attempts: 3
retry:
  max_attempts: 4
  base_delay_ms: 10
  max_delay_ms: 80
  jitter_ratio: 0.2
lock:
  ttl_ms: 2000
  timeout_ms: 700
store:
  backend: sqlite
  path: /var/lib/stagehand/db.sqlite
)";

} // namespace

// ============================================================
// parse_config
// ============================================================

TEST(Config, EmptyDocumentKeepsDefaults) {
  auto parsed = parse_config("");
  ASSERT_TRUE(parsed.is_ok());
  const AppConfig &c = parsed.value();
  EXPECT_EQ(c.engine.global_concurrency, 4);
  EXPECT_EQ(c.engine.per_unit_timeout_ms, 300000);
  EXPECT_EQ(c.engine.whole_run_timeout_ms, 0);
  EXPECT_FALSE(c.engine.fail_fast);
  EXPECT_EQ(c.engine.circuit_breaker.failure_threshold, 5);
  EXPECT_EQ(c.engine.retry.max_attempts, 3);
  EXPECT_EQ(c.store.backend, "memory");
  EXPECT_EQ(c.log_level, "info");
}

TEST(Config, ReadsEverySection) {
  auto parsed = parse_config(kFullConfig);
  ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;
  const AppConfig &c = parsed.value();
  const auto &e = c.engine;

  EXPECT_EQ(e.session_id, "nightly");
  EXPECT_EQ(e.global_concurrency, 8);
  EXPECT_TRUE(e.fail_fast);
  EXPECT_TRUE(e.allow_partial_results);
  EXPECT_DOUBLE_EQ(e.min_success_ratio, 0.6);
  EXPECT_EQ(e.required_unit_ids.size(), 2u);
  EXPECT_EQ(e.required_unit_ids.count("publish"), 1u);
  EXPECT_EQ(e.per_unit_timeout_ms, 1500);
  EXPECT_EQ(e.whole_run_timeout_ms, 60000);
  EXPECT_EQ(e.claim_stale_after_ms, 9000);
  EXPECT_EQ(e.kind_timeout_ms.at("render"), 2500);
  EXPECT_EQ(e.circuit_breaker.failure_threshold, 2);
  EXPECT_EQ(e.circuit_breaker.reset_timeout_ms, 100);
  EXPECT_EQ(e.circuit_breaker.half_open_max_attempts, 3);
  EXPECT_EQ(e.retry.max_attempts, 4);
  EXPECT_EQ(e.retry.base_delay_ms, 10);
  EXPECT_EQ(e.retry.max_delay_ms, 80);
  EXPECT_DOUBLE_EQ(e.retry.jitter_ratio, 0.2);
  EXPECT_EQ(c.lock.ttl_ms, 2000);
  EXPECT_EQ(c.lock.timeout_ms, 700);
  EXPECT_EQ(c.store.backend, "sqlite");
  EXPECT_EQ(c.store.path, "/var/lib/stagehand/db.sqlite");
  EXPECT_EQ(c.log_level, "debug");
}

TEST(Config, RejectsMalformedOrOutOfRangeValues) {
  const char *const bad[] = {
      "global_concurrency: many\n",
      "- just\n- a list\n",
      "retry: {max_attempts: 0}\n",
      "min_success_ratio: 1.2\n",
      "circuit_breaker: {failure_threshold: 0}\n",
      "lock: {ttl_ms: 0}\n",
      "store: {backend: redis}\n",
      "timeouts: {per_kind: {render: 0}}\n",
      "global_concurrency: [1\n",
  };
  for (const char *text : bad) {
    auto parsed = parse_config(text);
    ASSERT_TRUE(parsed.is_err()) << text;
    EXPECT_EQ(parsed.error().kind, ErrorKind::Validation) << text;
  }
}

TEST(Config, LoadsFromFile) {
  TempDir dir("config_file");
  const auto path = dir.path() / "stagehand.yaml";
  std::ofstream(path) << "global_concurrency: 2\n";

  auto loaded = load_config_file(path.string());
  ASSERT_TRUE(loaded.is_ok());
  EXPECT_EQ(loaded.value().engine.global_concurrency, 2);

  auto missing = load_config_file((dir.path() / "nope.yaml").string());
  ASSERT_TRUE(missing.is_err());
  EXPECT_EQ(missing.error().kind, ErrorKind::Validation);
}

// ============================================================
// Environment overrides
// ============================================================

TEST(Config, EnvironmentOverridesFileValues) {
  ScopedEnv concurrency("STAGEHAND_CONCURRENCY", "6");
  ScopedEnv run_timeout("STAGEHAND_RUN_TIMEOUT_MS", "0");
  ScopedEnv attempts("STAGEHAND_MAX_ATTEMPTS", "5");
  ScopedEnv session("STAGEHAND_SESSION_ID", "from-env");
  ScopedEnv store("STAGEHAND_STORE", "file");
  ScopedEnv store_path("STAGEHAND_STORE_PATH", "/tmp/stagehand-env");
  ScopedEnv level("STAGEHAND_LOG_LEVEL", "warn");

  AppConfig config = parse_config(kFullConfig).value();
  auto logger = std::make_shared<RecordingLogger>();
  apply_environment(config, logger);

  EXPECT_EQ(config.engine.global_concurrency, 6);
  EXPECT_EQ(config.engine.whole_run_timeout_ms, 0);
  EXPECT_EQ(config.engine.retry.max_attempts, 5);
  EXPECT_EQ(config.engine.session_id, "from-env");
  EXPECT_EQ(config.store.backend, "file");
  EXPECT_EQ(config.store.path, "/tmp/stagehand-env");
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_FALSE(logger->saw("env_invalid"));
}

TEST(Config, InvalidEnvironmentValuesAreIgnored) {
  ScopedEnv concurrency("STAGEHAND_CONCURRENCY", "0");
  ScopedEnv unit_timeout("STAGEHAND_UNIT_TIMEOUT_MS", "12abc");
  ScopedEnv run_timeout("STAGEHAND_RUN_TIMEOUT_MS", "-5");
  ScopedEnv store("STAGEHAND_STORE", "redis");

  AppConfig config;
  auto logger = std::make_shared<RecordingLogger>();
  apply_environment(config, logger);

  EXPECT_EQ(config.engine.global_concurrency, 4);
  EXPECT_EQ(config.engine.per_unit_timeout_ms, 300000);
  EXPECT_EQ(config.engine.whole_run_timeout_ms, 0);
  EXPECT_EQ(config.store.backend, "memory");
  EXPECT_TRUE(logger->saw("env_invalid"));
}

// ============================================================
// parse_plan
// ============================================================

TEST(Plan, ParsesMappingForm) {
  auto plan = parse_plan(R"(
units:
  - id: fetch
    kind: sleep
    priority: 5
    estimated_cost: 2.5
    timeout_ms: 1000
    params:
      duration_ms: 20
  - id: render
    kind: noop
    depends_on: [fetch]
)");
  ASSERT_TRUE(plan.is_ok()) << plan.error().message;
  const auto &units = plan.value();
  ASSERT_EQ(units.size(), 2u);

  EXPECT_EQ(units[0].id, "fetch");
  EXPECT_EQ(units[0].kind, "sleep");
  EXPECT_EQ(units[0].priority, 5);
  ASSERT_TRUE(units[0].estimated_cost.has_value());
  EXPECT_DOUBLE_EQ(*units[0].estimated_cost, 2.5);
  EXPECT_EQ(units[0].timeout_override_ms.value_or(0), 1000);
  EXPECT_EQ(units[0].params.at("duration_ms"), "20");

  EXPECT_EQ(units[1].depends_on, std::vector<std::string>{"fetch"});
  EXPECT_FALSE(units[1].estimated_cost.has_value());
  EXPECT_FALSE(units[1].timeout_override_ms.has_value());
}

TEST(Plan, ParsesSequenceForm) {
  auto plan = parse_plan("- {id: a, kind: noop}\n- {id: b, kind: noop, depends_on: [a]}\n");
  ASSERT_TRUE(plan.is_ok());
  ASSERT_EQ(plan.value().size(), 2u);
  EXPECT_EQ(plan.value()[1].depends_on.front(), "a");
}

TEST(Plan, RejectsMalformedPlans) {
  for (const char *text : {"", "name: no units here\n", "units: 3\n",
                           "- just a string\n", "- {id: a, priority: high}\n",
                           "units: [\n"}) {
    auto plan = parse_plan(text);
    ASSERT_TRUE(plan.is_err()) << text;
    EXPECT_EQ(plan.error().kind, ErrorKind::Validation) << text;
  }
}

// ============================================================
// create_store
// ============================================================

TEST(StoreFactory, BuildsEachBackend) {
  TempDir dir("store_factory");

  auto memory = create_store(StoreConfig{"memory", ""});
  ASSERT_TRUE(memory.is_ok());
  EXPECT_NE(dynamic_cast<MemoryStore *>(memory.value().get()), nullptr);

  auto file = create_store(StoreConfig{"file", (dir.path() / "files").string()});
  ASSERT_TRUE(file.is_ok());
  ASSERT_TRUE(file.value()->write("k", "v").is_ok());
  EXPECT_TRUE(std::filesystem::exists(dir.path() / "files" / "data" / "k"));

  auto sqlite = create_store(StoreConfig{"sqlite", (dir.path() / "db.sqlite").string()});
  ASSERT_TRUE(sqlite.is_ok());
  ASSERT_TRUE(sqlite.value()->write("k", "v").is_ok());
  EXPECT_TRUE(std::filesystem::exists(dir.path() / "db.sqlite"));
}

TEST(StoreFactory, UnknownBackendIsValidationError) {
  auto store = create_store(StoreConfig{"redis", ""});
  ASSERT_TRUE(store.is_err());
  EXPECT_EQ(store.error().kind, ErrorKind::Validation);
}

TEST(StoreFactory, UnopenableLocationIsStoreError) {
  TempDir dir("store_factory_bad");
  const auto blocker = dir.path() / "occupied";
  std::ofstream(blocker) << "a file, not a directory";

  auto store = create_store(StoreConfig{"file", (blocker / "nested").string()});
  ASSERT_TRUE(store.is_err());
  EXPECT_EQ(store.error().kind, ErrorKind::Store);
}
