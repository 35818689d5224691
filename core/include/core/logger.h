#pragma once

#include <string>

namespace stagehand::core {

/// Logger interface used by the scheduler, store and session code.
/// Concrete implementations live in infra. trace_id is the session id of
/// the run being logged, or a fixed tag for startup messages.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void debug(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace stagehand::core
