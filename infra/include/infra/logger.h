#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace tg::infra {

enum class LogLevel { Debug, Info, Warn, Error };

/// "debug", "info", "warn"/"warning", "error" (case-insensitive).
/// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string &text, LogLevel &out);

const char *to_string(LogLevel level);

/// spdlog-backed console logger.
/// Format: [ts] [level] [task_id] [component] event: msg
std::unique_ptr<tg::core::ILogger>
create_console_logger(LogLevel level = LogLevel::Info);

} // namespace tg::infra
