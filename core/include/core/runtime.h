#pragma once

#include "core/queue_worker.h"
#include "core/resource_monitor.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"
#include "core/task_queue.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace tg::core {

class ILogger;

struct RuntimeConfig {
  MonitorProfile profile = MonitorProfile::production();
  std::chrono::milliseconds worker_interval = QueueWorker::kDefaultInterval;
  TaskQueueConfig queue{};
};

/// What submit() did with a job.
struct Submission {
  std::string task_id;
  bool started = false;   // true: running now; false: queued
  std::string reason;     // Admission reason from the monitor
  std::optional<std::size_t> queue_position; // Set when queued
};

/// Application-scoped scheduler context: one per process, created at startup
/// and handed to every consumer. Owns the monitor, the queue and the worker.
class SchedulerRuntime {
public:
  SchedulerRuntime(RuntimeConfig config,
                   std::shared_ptr<IResourceSampler> sampler,
                   std::shared_ptr<ILogger> logger = nullptr);

  /// Runs shutdown().
  ~SchedulerRuntime();

  SchedulerRuntime(const SchedulerRuntime &) = delete;
  SchedulerRuntime &operator=(const SchedulerRuntime &) = delete;

  /// Starts the background worker.
  void start();

  /// Stops the worker, then waits for running jobs. Idempotent.
  void shutdown();

  /// Caller-side admission: check the kind; if admitted register it as
  /// running (with `initial_description` if given), otherwise enqueue it and
  /// report its position.
  Result<Submission, TaskError>
  submit(JobKind kind, std::unique_ptr<IJob> job, EnqueueOptions options = {},
         const std::optional<std::string> &initial_description = std::nullopt);

  [[nodiscard]] ResourceMonitor &monitor() const { return *monitor_; }
  [[nodiscard]] TaskQueue &queue() const { return *queue_; }
  [[nodiscard]] QueueWorker &worker() const { return *worker_; }

private:
  std::shared_ptr<ILogger> logger_;
  std::shared_ptr<ResourceMonitor> monitor_;
  std::unique_ptr<TaskQueue> queue_;
  std::unique_ptr<QueueWorker> worker_;
};

} // namespace tg::core
