#pragma once

#include "core/event.h"
#include "core/event_bus.h"
#include "core/event_channel.h"
#include "core/job_executor.h"
#include "core/resource_monitor.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tg::core {

class ILogger;

struct EnqueueOptions {
  int priority = 0;                    // Higher runs sooner; ignored for
                                       // register_running_task
  std::optional<std::string> task_id;  // Generated when absent
  std::string owner;                   // Used by get_queue_status filtering
};

struct TaskQueueConfig {
  std::size_t subscriber_capacity = 256; // Per-channel bound, 0 = unbounded
};

/// Single source of truth for pending and running work.
///
/// Per task: absent -> pending -> running -> absent (enqueue, promotion), or
/// absent -> running -> absent (register_running_task). A task id is never in
/// both collections. All mutations happen under one mutex which is never held
/// while a job runs or while the host is sampled. Every transition is
/// published on the EventBus while the mutex is held, so subscribers see
/// events in mutation order.
///
/// No cancellation or timeout: a dispatched job runs until it returns or
/// throws.
class TaskQueue {
public:
  TaskQueue(std::shared_ptr<ResourceMonitor> monitor,
            std::shared_ptr<ILogger> logger = nullptr,
            TaskQueueConfig config = {});

  /// Stops accepting work, waits for running jobs, drains events.
  ~TaskQueue();

  TaskQueue(const TaskQueue &) = delete;
  TaskQueue &operator=(const TaskQueue &) = delete;

  /// Inserts before the first pending task with strictly lower priority and
  /// publishes task_queued. Does not look at resources.
  Result<std::string, TaskError> enqueue(JobKind kind,
                                         std::unique_ptr<IJob> job,
                                         EnqueueOptions options = {});

  /// Promotes the head of the pending collection if the monitor admits its
  /// kind. Returns the promoted id without waiting for the job. A rejected
  /// head blocks everything behind it.
  std::optional<std::string> try_execute_next();

  /// Fast path for callers that already ran can_run_task themselves.
  Result<std::string, TaskError>
  register_running_task(JobKind kind, std::unique_ptr<IJob> job,
                        EnqueueOptions options = {});

  /// Consistent snapshot. With an owner filter only that owner's tasks are
  /// listed and counted; queue_position stays global.
  [[nodiscard]] QueueStatus
  get_queue_status(const std::optional<std::string> &owner = std::nullopt) const;

  /// 1-indexed position in the pending collection.
  [[nodiscard]] std::optional<std::size_t>
  get_task_position(const std::string &task_id) const;

  /// No-op unless task_id is running.
  void update_task_description(const std::string &task_id,
                               const std::string &description);

  std::shared_ptr<EventChannel>
  subscribe_to_events(std::optional<std::size_t> capacity = std::nullopt);
  void unsubscribe_from_events(const std::shared_ptr<EventChannel> &channel);

  [[nodiscard]] bool has_active_tasks() const;

  /// Refuses new work, then blocks until every running job finished.
  void shutdown();

  [[nodiscard]] ResourceMonitor &monitor() const { return *monitor_; }

private:
  Result<std::string, TaskError> validate_new_task_locked(
      const std::unique_ptr<IJob> &job,
      const std::optional<std::string> &requested_id) const;

  bool contains_locked(const std::string &task_id) const;

  std::vector<QueuedTask>::iterator find_running_locked(const std::string &id);

  /// Moves `task` into the running set, publishes task_running and hands the
  /// job to the executor. Called with the mutex held.
  void start_locked(QueuedTask task);

  void execute(const std::string &task_id);
  void finish(const std::string &task_id, bool success);

  std::shared_ptr<ResourceMonitor> monitor_;
  std::shared_ptr<ILogger> logger_;
  TaskQueueConfig config_;

  mutable std::mutex mutex_;
  std::deque<QueuedTask> pending_;
  std::vector<QueuedTask> running_; // Start order
  bool stopping_ = false;

  EventBus bus_;
  JobExecutor executor_;
};

} // namespace tg::core
