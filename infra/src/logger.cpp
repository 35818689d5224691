#include "infra/logger.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace stagehand::infra {

namespace {

constexpr const char *kPattern = "[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v";

spdlog::level::level_enum parse_level(const std::string &level) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off; only an explicit "off" should.
  if (parsed == spdlog::level::off && level != "off") {
    return spdlog::level::info;
  }
  return parsed;
}

/// SpdLogger: structured ILogger on top of any spdlog logger.
class SpdLogger : public core::ILogger {
public:
  explicit SpdLogger(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {}

  void debug(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->debug("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::shared_ptr<core::ILogger> create_console_logger(const std::string &level) {
  auto logger = spdlog::get("stagehand");
  if (!logger) {
    logger = spdlog::stdout_color_mt("stagehand");
  }
  logger->set_pattern(kPattern);
  logger->set_level(parse_level(level));
  return std::make_shared<SpdLogger>(std::move(logger));
}

std::shared_ptr<core::ILogger> create_file_logger(const std::string &path,
                                                  const std::string &level) {
  // Not registered globally: several file loggers may coexist in one process.
  auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
  auto logger = std::make_shared<spdlog::logger>("stagehand-file", sink);
  logger->set_pattern(kPattern);
  logger->set_level(parse_level(level));
  logger->flush_on(spdlog::level::warn);
  return std::make_shared<SpdLogger>(std::move(logger));
}

} // namespace stagehand::infra
