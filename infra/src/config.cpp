#include "infra/config.h"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <stdexcept>
#include <sstream>

namespace stagehand::infra {

using core::Result;
using core::StageError;

namespace {

const char *const kStartupTrace = "startup";

template <typename T>
void read_value(const YAML::Node &node, const char *key, T &out) {
  const YAML::Node child = node[key];
  if (child && !child.IsNull()) {
    out = child.as<T>();
  }
}

bool is_known_backend(const std::string &backend) {
  return backend == "memory" || backend == "file" || backend == "sqlite";
}

Result<std::string, StageError> read_file(const std::string &path,
                                          const char *what) {
  std::ifstream in(path);
  if (!in) {
    return Result<std::string, StageError>::Err(StageError::Validation(
        std::string("Cannot open ") + what + " file: " + path));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Result<std::string, StageError>::Ok(buffer.str());
}

Result<void, StageError> validate_config(const AppConfig &config) {
  auto engine = core::validate(config.engine);
  if (engine.is_err()) {
    return engine;
  }
  if (config.lock.ttl_ms < 1 || config.lock.timeout_ms < 0) {
    return Result<void, StageError>::Err(StageError::Validation(
        "lock.ttl_ms must be >= 1 and lock.timeout_ms >= 0"));
  }
  if (!is_known_backend(config.store.backend)) {
    return Result<void, StageError>::Err(StageError::Validation(
        "store.backend must be memory, file or sqlite, got '" +
        config.store.backend + "'"));
  }
  return Result<void, StageError>::Ok();
}

int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  char *end = nullptr;
  const long value = std::strtol(raw, &end, 10);
  const bool valid = end && *end == 0 && (allow_zero ? value >= 0 : value > 0);
  if (!valid) {
    if (logger) {
      logger->warn(kStartupTrace, "config", "env_invalid",
                   std::string("Invalid value for ") + name + "=" + raw +
                       ", fallback=" + std::to_string(fallback));
    }
    return fallback;
  }
  return static_cast<int>(value);
}

std::string parse_env_string(const char *name, const std::string &fallback) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }
  return raw;
}

core::WorkUnit parse_unit(const YAML::Node &node, size_t index) {
  if (!node.IsMap()) {
    throw std::runtime_error("unit #" + std::to_string(index) +
                             " is not a mapping");
  }
  core::WorkUnit unit;
  read_value(node, "id", unit.id);
  read_value(node, "kind", unit.kind);
  read_value(node, "priority", unit.priority);

  if (const YAML::Node deps = node["depends_on"]; deps && !deps.IsNull()) {
    unit.depends_on = deps.as<std::vector<std::string>>();
  }
  if (const YAML::Node cost = node["estimated_cost"]; cost && !cost.IsNull()) {
    unit.estimated_cost = cost.as<double>();
  }
  if (const YAML::Node timeout = node["timeout_ms"]; timeout && !timeout.IsNull()) {
    unit.timeout_override_ms = timeout.as<int>();
  }
  if (const YAML::Node params = node["params"]; params && params.IsMap()) {
    for (const auto &entry : params) {
      unit.params[entry.first.as<std::string>()] =
          entry.second.IsNull() ? std::string() : entry.second.as<std::string>();
    }
  }
  return unit;
}

} // namespace

Result<AppConfig, StageError> parse_config(const std::string &yaml_text) {
  AppConfig config;
  try {
    const YAML::Node root = YAML::Load(yaml_text);
    if (root.IsNull()) {
      return Result<AppConfig, StageError>::Ok(config); // Empty document
    }
    if (!root.IsMap()) {
      return Result<AppConfig, StageError>::Err(
          StageError::Validation("Configuration root must be a mapping"));
    }

    auto &engine = config.engine;
    read_value(root, "session_id", engine.session_id);
    read_value(root, "global_concurrency", engine.global_concurrency);
    read_value(root, "fail_fast", engine.fail_fast);
    read_value(root, "allow_partial_results", engine.allow_partial_results);
    read_value(root, "min_success_ratio", engine.min_success_ratio);
    read_value(root, "log_level", config.log_level);

    if (const YAML::Node required = root["required_unit_ids"];
        required && !required.IsNull()) {
      for (const auto &id : required.as<std::vector<std::string>>()) {
        engine.required_unit_ids.insert(id);
      }
    }

    if (const YAML::Node timeouts = root["timeouts"]; timeouts && timeouts.IsMap()) {
      read_value(timeouts, "per_unit_ms", engine.per_unit_timeout_ms);
      read_value(timeouts, "whole_run_ms", engine.whole_run_timeout_ms);
      read_value(timeouts, "claim_stale_ms", engine.claim_stale_after_ms);
      if (const YAML::Node per_kind = timeouts["per_kind"];
          per_kind && per_kind.IsMap()) {
        for (const auto &entry : per_kind) {
          engine.kind_timeout_ms[entry.first.as<std::string>()] =
              entry.second.as<int>();
        }
      }
    }

    if (const YAML::Node breaker = root["circuit_breaker"]; breaker && breaker.IsMap()) {
      read_value(breaker, "failure_threshold",
                 engine.circuit_breaker.failure_threshold);
      read_value(breaker, "reset_timeout_ms",
                 engine.circuit_breaker.reset_timeout_ms);
      read_value(breaker, "half_open_max_attempts",
                 engine.circuit_breaker.half_open_max_attempts);
    }

    if (const YAML::Node retry = root["retry"]; retry && retry.IsMap()) {
      read_value(retry, "max_attempts", engine.retry.max_attempts);
      read_value(retry, "base_delay_ms", engine.retry.base_delay_ms);
      read_value(retry, "max_delay_ms", engine.retry.max_delay_ms);
      read_value(retry, "jitter_ratio", engine.retry.jitter_ratio);
    }

    if (const YAML::Node lock = root["lock"]; lock && lock.IsMap()) {
      read_value(lock, "ttl_ms", config.lock.ttl_ms);
      read_value(lock, "timeout_ms", config.lock.timeout_ms);
    }

    if (const YAML::Node store = root["store"]; store && store.IsMap()) {
      read_value(store, "backend", config.store.backend);
      read_value(store, "path", config.store.path);
    }
  } catch (const YAML::Exception &e) {
    return Result<AppConfig, StageError>::Err(
        StageError::Validation(std::string("Invalid configuration: ") + e.what()));
  }

  auto valid = validate_config(config);
  if (valid.is_err()) {
    return Result<AppConfig, StageError>::Err(valid.error());
  }
  return Result<AppConfig, StageError>::Ok(std::move(config));
}

Result<AppConfig, StageError> load_config_file(const std::string &path) {
  auto text = read_file(path, "configuration");
  if (text.is_err()) {
    return Result<AppConfig, StageError>::Err(text.error());
  }
  return parse_config(text.value());
}

void apply_environment(AppConfig &config,
                       const std::shared_ptr<core::ILogger> &logger) {
  auto &engine = config.engine;
  engine.session_id =
      parse_env_string("STAGEHAND_SESSION_ID", engine.session_id);
  engine.global_concurrency = parse_env_int(
      "STAGEHAND_CONCURRENCY", engine.global_concurrency, false, logger);
  engine.per_unit_timeout_ms = parse_env_int(
      "STAGEHAND_UNIT_TIMEOUT_MS", engine.per_unit_timeout_ms, false, logger);
  engine.whole_run_timeout_ms = parse_env_int(
      "STAGEHAND_RUN_TIMEOUT_MS", engine.whole_run_timeout_ms, true, logger);
  engine.retry.max_attempts = parse_env_int(
      "STAGEHAND_MAX_ATTEMPTS", engine.retry.max_attempts, false, logger);

  const std::string backend =
      parse_env_string("STAGEHAND_STORE", config.store.backend);
  if (is_known_backend(backend)) {
    config.store.backend = backend;
  } else if (logger) {
    logger->warn(kStartupTrace, "config", "env_invalid",
                 "Invalid value for STAGEHAND_STORE=" + backend +
                     ", fallback=" + config.store.backend);
  }
  config.store.path = parse_env_string("STAGEHAND_STORE_PATH", config.store.path);
  config.log_level = parse_env_string("STAGEHAND_LOG_LEVEL", config.log_level);
}

Result<std::vector<core::WorkUnit>, StageError>
parse_plan(const std::string &yaml_text) {
  using PlanResult = Result<std::vector<core::WorkUnit>, StageError>;
  try {
    const YAML::Node root = YAML::Load(yaml_text);
    const YAML::Node list = root.IsMap() ? root["units"] : root;
    if (!list || !list.IsSequence()) {
      return PlanResult::Err(
          StageError::Validation("Plan must be a sequence of units or a "
                                 "mapping with a 'units' sequence"));
    }

    std::vector<core::WorkUnit> units;
    units.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
      units.push_back(parse_unit(list[i], i));
    }
    return PlanResult::Ok(std::move(units));
  } catch (const std::exception &e) {
    return PlanResult::Err(
        StageError::Validation(std::string("Invalid plan: ") + e.what()));
  }
}

Result<std::vector<core::WorkUnit>, StageError>
load_plan_file(const std::string &path) {
  auto text = read_file(path, "plan");
  if (text.is_err()) {
    return Result<std::vector<core::WorkUnit>, StageError>::Err(text.error());
  }
  return parse_plan(text.value());
}

} // namespace stagehand::infra
