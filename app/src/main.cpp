#include "core/execution_engine.h"
#include "core/logger.h"
#include "core/session_repository.h"
#include "infra/config.h"
#include "infra/handlers.h"
#include "infra/logger.h"
#include "infra/store_factory.h"
#include "infra/yaml_session_codec.h"

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted = true; }

void print_usage(const char *argv0) {
  std::cerr << "usage: " << argv0 << " <plan.yaml> [config.yaml]\n"
            << "Runs a work-unit plan with the built-in handlers "
               "(noop, sleep, fail, flaky) and prints the run report.\n";
}

void emit_error(YAML::Emitter &out, const stagehand::core::StageError &error) {
  out << YAML::BeginMap;
  out << YAML::Key << "kind" << YAML::Value << stagehand::core::to_string(error.kind);
  out << YAML::Key << "category" << YAML::Value
      << stagehand::core::to_string(error.category);
  out << YAML::Key << "message" << YAML::Value << error.message;
  if (!error.unit_id.empty()) {
    out << YAML::Key << "unit_id" << YAML::Value << error.unit_id;
  }
  out << YAML::Key << "attempts" << YAML::Value << error.attempts;
  for (const auto &[key, value] : error.details) {
    out << YAML::Key << key << YAML::Value << value;
  }
  out << YAML::EndMap;
}

std::string format_report(const stagehand::core::RunReport &report) {
  using stagehand::core::to_string;

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "session_id" << YAML::Value << report.session_id;
  out << YAML::Key << "overall_status" << YAML::Value
      << to_string(report.overall_status);
  if (report.error.has_value()) {
    out << YAML::Key << "error" << YAML::Value;
    emit_error(out, *report.error);
  }

  const auto &stats = report.statistics;
  out << YAML::Key << "statistics" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "total" << YAML::Value << stats.total;
  out << YAML::Key << "succeeded" << YAML::Value << stats.succeeded;
  out << YAML::Key << "failed" << YAML::Value << stats.failed;
  out << YAML::Key << "skipped" << YAML::Value << stats.skipped;
  out << YAML::Key << "retries" << YAML::Value << stats.retries;
  out << YAML::Key << "circuit_rejections" << YAML::Value
      << stats.circuit_rejections;
  out << YAML::Key << "total_duration_ms" << YAML::Value
      << stats.total_duration_ms;
  out << YAML::EndMap;

  out << YAML::Key << "waves" << YAML::Value << YAML::BeginSeq;
  for (const auto &wave : report.waves) {
    out << YAML::Flow << wave;
  }
  out << YAML::EndSeq;
  out << YAML::Key << "critical_path" << YAML::Value << YAML::Flow
      << report.critical_path;

  out << YAML::Key << "units" << YAML::Value << YAML::BeginSeq;
  for (const auto &unit : report.per_unit) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << unit.id;
    out << YAML::Key << "kind" << YAML::Value << unit.kind;
    out << YAML::Key << "status" << YAML::Value << to_string(unit.status);
    out << YAML::Key << "attempts" << YAML::Value << unit.attempts;
    out << YAML::Key << "duration_ms" << YAML::Value << unit.duration_ms;
    if (unit.error.has_value()) {
      out << YAML::Key << "error" << YAML::Value;
      emit_error(out, *unit.error);
    }
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::EndMap;
  return out.c_str();
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2 || argc > 3) {
    print_usage(argv[0]);
    return 2;
  }

  // Config file first: it decides the log level the logger starts with.
  stagehand::infra::AppConfig config;
  std::string config_error;
  if (argc == 3) {
    auto loaded = stagehand::infra::load_config_file(argv[2]);
    if (loaded.is_ok()) {
      config = std::move(loaded).value();
    } else {
      config_error = loaded.error().message;
    }
  }

  auto bootstrap_logger = stagehand::infra::create_console_logger(config.log_level);
  if (!config_error.empty()) {
    bootstrap_logger->error("startup", "app", "config_invalid", config_error);
    return 2;
  }
  stagehand::infra::apply_environment(config, bootstrap_logger);
  auto logger = stagehand::infra::create_console_logger(config.log_level);

  auto plan = stagehand::infra::load_plan_file(argv[1]);
  if (plan.is_err()) {
    logger->error("startup", "app", "plan_invalid", plan.error().message);
    return 2;
  }

  auto store = stagehand::infra::create_store(config.store);
  if (store.is_err()) {
    logger->error("startup", "app", "store_unavailable", store.error().message);
    return 2;
  }
  logger->info("startup", "app", "store_ready",
               "backend=" + config.store.backend +
                   (config.store.path.empty() ? "" : " path=" + config.store.path));

  auto sessions = std::make_shared<stagehand::core::SessionRepository>(
      std::move(store).value(),
      std::make_shared<stagehand::infra::YamlSessionCodec>(), config.lock,
      logger);

  stagehand::core::HandlerRegistry handlers;
  stagehand::infra::register_builtin_handlers(handlers);

  stagehand::core::ExecutionEngine engine(sessions, handlers, logger);
  engine.on_event([logger](const std::string &session_id,
                           const stagehand::core::ProgressEvent &event) {
    logger->info(session_id, "progress",
                 event.unit_id.empty() ? "run" : event.unit_id,
                 "#" + std::to_string(event.seq) + " " + event.status +
                     (event.message.empty() ? "" : " - " + event.message));
  });

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::atomic<bool> finished{false};
  std::thread interrupt_watcher([&engine, &finished, logger]() {
    while (!finished) {
      if (g_interrupted.exchange(false)) {
        logger->warn("startup", "app", "interrupted", "Canceling run");
        engine.cancel();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  auto result = engine.run(std::move(plan).value(), config.engine);
  finished = true;
  interrupt_watcher.join();

  if (result.is_err()) {
    logger->error("startup", "app", "run_rejected",
                  std::string("[") + stagehand::core::to_string(result.error().kind) +
                      "] " + result.error().message);
    return 2;
  }

  const auto &report = result.value();
  std::cout << format_report(report) << std::endl;
  return report.overall_status == stagehand::core::RunStatus::Completed ||
                 report.overall_status == stagehand::core::RunStatus::Partial
             ? 0
             : 1;
}
