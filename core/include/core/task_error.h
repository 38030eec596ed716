#pragma once

#include <map>
#include <string>

namespace tg::core {

/// Error categories for scheduler operations and job execution.
enum class ErrorCategory {
  InvalidArgument, // Null job, empty or malformed input
  Duplicate,       // Task id already pending or running
  Resource,        // Host resource sampling failed
  Execution,       // Unit of work reported or threw an error
  Internal,        // Invariant violation
  Unknown
};

/// Structured error carried by Result<T, TaskError>.
/// user_message is safe to surface to API clients; internal_message is for logs.
struct TaskError {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0;
  std::string user_message;
  std::string internal_message;
  std::map<std::string, std::string> details;

  TaskError() = default;

  TaskError(ErrorCategory cat, int c, std::string msg)
      : category(cat), code(c), user_message(msg),
        internal_message(std::move(msg)) {}

  TaskError(ErrorCategory cat, int c, std::string user_msg,
            std::string internal_msg,
            std::map<std::string, std::string> dets = {})
      : category(cat), code(c), user_message(std::move(user_msg)),
        internal_message(std::move(internal_msg)), details(std::move(dets)) {}

  static TaskError InvalidArgument(std::string msg) {
    return {ErrorCategory::InvalidArgument, 1001, std::move(msg)};
  }
  static TaskError Duplicate(const std::string &task_id) {
    return {ErrorCategory::Duplicate, 1002, "Task already exists: " + task_id,
            "task_id is already pending or running", {{"task_id", task_id}}};
  }
  static TaskError Resource(std::string msg) {
    return {ErrorCategory::Resource, 2001, std::move(msg)};
  }
  static TaskError Execution(std::string msg) {
    return {ErrorCategory::Execution, 3001, std::move(msg)};
  }
  static TaskError Internal(std::string msg) {
    return {ErrorCategory::Internal, 4001, std::move(msg)};
  }
};

inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::InvalidArgument:
    return "InvalidArgument";
  case ErrorCategory::Duplicate:
    return "Duplicate";
  case ErrorCategory::Resource:
    return "Resource";
  case ErrorCategory::Execution:
    return "Execution";
  case ErrorCategory::Internal:
    return "Internal";
  case ErrorCategory::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

} // namespace tg::core
