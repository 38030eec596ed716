#include "infra/config.h"

#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace tg::infra {

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

void warn_invalid(const std::shared_ptr<tg::core::ILogger> &logger,
                  const char *name, const char *raw,
                  const std::string &fallback) {
  if (logger) {
    logger->warn("startup", "config", "invalid_value",
                 std::string("Invalid value for ") + name + "=" + raw +
                     ", fallback=" + fallback);
  }
}

bool parse_env_bool(const EnvLookup &lookup, const char *name, bool fallback,
                    const std::shared_ptr<tg::core::ILogger> &logger) {
  const char *raw = lookup(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }
  const std::string value = lowercase(raw);
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  warn_invalid(logger, name, raw, fallback ? "true" : "false");
  return fallback;
}

int parse_env_int(const EnvLookup &lookup, const char *name, int fallback,
                  const std::shared_ptr<tg::core::ILogger> &logger) {
  const char *raw = lookup(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }
  char *end = nullptr;
  const long value = std::strtol(raw, &end, 10);
  if (!end || *end != 0 || value < 0 || value > 10000) {
    warn_invalid(logger, name, raw, std::to_string(fallback));
    return fallback;
  }
  return static_cast<int>(value);
}

} // namespace

AppConfig
AppConfig::from_environment(const std::shared_ptr<tg::core::ILogger> &logger) {
  return from_lookup([](const char *name) { return std::getenv(name); },
                     logger);
}

AppConfig AppConfig::from_lookup(
    const EnvLookup &lookup, const std::shared_ptr<tg::core::ILogger> &logger) {
  AppConfig config;
  config.dev_mode =
      parse_env_bool(lookup, "TASKGATE_DEV_MODE", config.dev_mode, logger);

  const char *level = lookup("TASKGATE_LOG_LEVEL");
  if (level && level[0] != 0 && !parse_log_level(level, config.log_level)) {
    warn_invalid(logger, "TASKGATE_LOG_LEVEL", level,
                 to_string(config.log_level));
  }

  config.demo_jobs =
      parse_env_int(lookup, "TASKGATE_DEMO_JOBS", config.demo_jobs, logger);
  return config;
}

tg::core::RuntimeConfig AppConfig::runtime_config() const {
  tg::core::RuntimeConfig runtime;
  runtime.profile = tg::core::MonitorProfile::for_mode(dev_mode);
  return runtime;
}

} // namespace tg::infra
