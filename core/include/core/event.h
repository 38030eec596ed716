#pragma once

#include "core/resource_monitor.h"
#include "core/task.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tg::core {

enum class EventType {
  TaskQueued,
  TaskRunning,
  TaskCompleted,
  TaskDescriptionUpdate,
  Heartbeat,
  InitialState
};

/// Wire name, e.g. "task_queued", "heartbeat".
const char *to_string(EventType type);

// ---- Queue status snapshot ----

struct QueuedTaskInfo {
  std::string task_id;
  JobKind kind = JobKind::Backtest;
  int priority = 0;
  std::chrono::system_clock::time_point queued_at;
  double estimated_cpu_cores = 0.0;
  double estimated_ram_gb = 0.0;
  std::size_t queue_position = 0; // 1-indexed over the whole pending collection
  std::string description;
  std::string owner;
};

struct RunningTaskInfo {
  std::string task_id;
  JobKind kind = JobKind::Backtest;
  double estimated_cpu_cores = 0.0;
  double estimated_ram_gb = 0.0;
  std::string description;
  std::string owner;
};

struct QueueStatus {
  std::size_t queued_count = 0;
  std::size_t running_count = 0;
  std::vector<QueuedTaskInfo> queued_tasks;
  std::vector<RunningTaskInfo> running_tasks;
};

// ---- Event payloads ----

struct TaskQueuedData {
  std::string task_id;
  JobKind kind = JobKind::Backtest;
  double estimated_cpu_cores = 0.0;
  double estimated_ram_gb = 0.0;
  std::size_t queue_position = 0;
  std::string description;
};

struct TaskRunningData {
  std::string task_id;
  JobKind kind = JobKind::Backtest;
  double estimated_cpu_cores = 0.0;
  double estimated_ram_gb = 0.0;
};

struct TaskCompletedData {
  std::string task_id;
  JobKind kind = JobKind::Backtest;
  bool success = false;
};

struct TaskDescriptionData {
  std::string task_id;
  JobKind kind = JobKind::Backtest;
  std::string description;
};

/// std::monostate is the data-less heartbeat; QueueStatus is initial_state.
using EventData =
    std::variant<std::monostate, TaskQueuedData, TaskRunningData,
                 TaskCompletedData, TaskDescriptionData, QueueStatus>;

/// Immutable broadcast message. `resources` is attached at dispatch time.
struct Event {
  EventType type = EventType::Heartbeat;
  std::chrono::system_clock::time_point timestamp =
      std::chrono::system_clock::now();
  EventData data;
  std::optional<ResourceSummary> resources;

  /// Task id carried by the payload, empty for heartbeat/initial_state.
  [[nodiscard]] std::string task_id() const;
};

} // namespace tg::core
