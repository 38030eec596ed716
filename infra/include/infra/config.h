#pragma once

#include "core/runtime.h"
#include "infra/logger.h"

#include <functional>
#include <memory>
#include <string>

namespace tg::core {
class ILogger;
} // namespace tg::core

namespace tg::infra {

/// Returns the raw value of an environment variable, or nullptr when unset.
using EnvLookup = std::function<const char *(const char *)>;

/// Process configuration, read once at startup.
///
///   TASKGATE_DEV_MODE   "true"/"1" selects the relaxed admission profile
///                       (5% buffer, 50% consumption) instead of production
///                       (20% buffer, 80% consumption). "false"/"0" keep
///                       production. Case-insensitive, no other spellings.
///   TASKGATE_LOG_LEVEL  debug | info | warn | error (default info)
///   TASKGATE_DEMO_JOBS  simulated jobs submitted by taskgated (default 6)
///
/// Invalid values are logged and replaced by the default.
struct AppConfig {
  bool dev_mode = false;
  LogLevel log_level = LogLevel::Info;
  int demo_jobs = 6;

  static AppConfig from_environment(
      const std::shared_ptr<tg::core::ILogger> &logger = nullptr);

  static AppConfig from_lookup(
      const EnvLookup &lookup,
      const std::shared_ptr<tg::core::ILogger> &logger = nullptr);

  /// Runtime settings implied by this configuration.
  [[nodiscard]] tg::core::RuntimeConfig runtime_config() const;
};

} // namespace tg::infra
