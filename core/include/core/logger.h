#pragma once

#include <string>

namespace tg::core {

/// Structured logger used by every core component.
/// `task_id` is the correlation key ("-" or a component tag when no task is
/// involved). Concrete implementations live in infra; a null
/// std::shared_ptr<ILogger> means "don't log".
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void debug(const std::string &task_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;

  virtual void info(const std::string &task_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &task_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &task_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace tg::core
