#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace stagehand::infra {

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
/// `level` is an spdlog level name (trace, debug, info, warn, error, off);
/// unknown names fall back to info.
std::shared_ptr<core::ILogger> create_console_logger(const std::string &level = "info");

/// Same format, appended to `path`. Throws spdlog::spdlog_ex when the file
/// cannot be opened.
std::shared_ptr<core::ILogger> create_file_logger(const std::string &path,
                                                  const std::string &level = "info");

} // namespace stagehand::infra
