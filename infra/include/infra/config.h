#pragma once

#include "core/execution_engine.h"
#include "core/logger.h"
#include "core/result.h"
#include "core/session_repository.h"
#include "core/stage_error.h"
#include "core/work_unit.h"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace stagehand::infra {

/// XDG Base Directory locations for default store files.
/// See https://specifications.freedesktop.org/basedir-spec/basedir-spec-latest.html
class XdgPaths {
public:
  /// $XDG_DATA_HOME/stagehand, else ~/.local/share/stagehand, else
  /// /tmp/stagehand. Created on first use.
  static std::filesystem::path get_data_dir() {
    const char *xdg_data = std::getenv("XDG_DATA_HOME");
    std::filesystem::path base;

    if (xdg_data && xdg_data[0] != '\0') {
      base = xdg_data;
    } else {
      const char *home = std::getenv("HOME");
      if (home && home[0] != '\0') {
        base = std::filesystem::path(home) / ".local" / "share";
      } else {
        base = "/tmp"; // Fallback
      }
    }

    auto dir = base / "stagehand";
    std::filesystem::create_directories(dir);
    return dir;
  }
};

struct StoreConfig {
  std::string backend = "memory"; // memory | file | sqlite
  std::string path;               // Empty: under XdgPaths::get_data_dir()
};

/// Application configuration
struct AppConfig {
  core::EngineOptions engine;
  core::LockOptions lock;
  StoreConfig store;
  std::string log_level = "info";
};

/// Parse a YAML configuration document. Missing keys keep their defaults.
/// Errors: ErrorKind::Validation for malformed YAML, wrongly typed values
/// or out-of-range settings.
core::Result<AppConfig, core::StageError> parse_config(const std::string &yaml_text);

/// parse_config() on the contents of `path`.
core::Result<AppConfig, core::StageError> load_config_file(const std::string &path);

/// Apply STAGEHAND_* environment overrides. Invalid values are logged and
/// ignored.
void apply_environment(AppConfig &config,
                       const std::shared_ptr<core::ILogger> &logger);

/// Parse a work-unit plan: either a sequence of units or a mapping with a
/// `units` sequence. Graph-level checks are left to DependencyGraph.
core::Result<std::vector<core::WorkUnit>, core::StageError>
parse_plan(const std::string &yaml_text);

core::Result<std::vector<core::WorkUnit>, core::StageError>
load_plan_file(const std::string &path);

} // namespace stagehand::infra
