#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace tg::infra {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return spdlog::level::debug;
  case LogLevel::Info:
    return spdlog::level::info;
  case LogLevel::Warn:
    return spdlog::level::warn;
  case LogLevel::Error:
    return spdlog::level::err;
  }
  return spdlog::level::info;
}

/// One shared "taskgate" spdlog logger, colored stdout.
class ConsoleLogger : public tg::core::ILogger {
public:
  explicit ConsoleLogger(LogLevel level) {
    logger_ = spdlog::get("taskgate");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("taskgate");
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
    logger_->set_level(to_spdlog(level));
  }

  void debug(const std::string &task_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->debug("[{}] [{}] {}: {}", task_id, component, event, msg);
  }

  void info(const std::string &task_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", task_id, component, event, msg);
  }

  void warn(const std::string &task_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", task_id, component, event, msg);
  }

  void error(const std::string &task_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", task_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

bool parse_log_level(const std::string &text, LogLevel &out) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    out = LogLevel::Debug;
  } else if (lower == "info") {
    out = LogLevel::Info;
  } else if (lower == "warn" || lower == "warning") {
    out = LogLevel::Warn;
  } else if (lower == "error") {
    out = LogLevel::Error;
  } else {
    return false;
  }
  return true;
}

const char *to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  }
  return "info";
}

std::unique_ptr<tg::core::ILogger> create_console_logger(LogLevel level) {
  return std::make_unique<ConsoleLogger>(level);
}

} // namespace tg::infra
