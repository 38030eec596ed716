#include "core/task_queue.h"

#include "core/logger.h"

#include <exception>
#include <utility>

namespace tg::core {

namespace {
constexpr const char *kComponent = "task_queue";
} // namespace

TaskQueue::TaskQueue(std::shared_ptr<ResourceMonitor> monitor,
                     std::shared_ptr<ILogger> logger, TaskQueueConfig config)
    : monitor_(std::move(monitor)), logger_(std::move(logger)),
      config_(config),
      bus_(
          [monitor = monitor_]() {
            return monitor ? monitor->get_resource_summary()
                           : ResourceSummary{};
          },
          logger_, config_.subscriber_capacity) {}

TaskQueue::~TaskQueue() {
  shutdown();
  bus_.shutdown();
}

void TaskQueue::shutdown() {
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stopping_) {
      stopping_ = true;
      dropped = pending_.size();
    }
  }
  if (dropped > 0 && logger_) {
    logger_->warn("-", kComponent, "shutdown",
                  std::to_string(dropped) + " pending task(s) never started");
  }
  executor_.join_all();
}

bool TaskQueue::contains_locked(const std::string &task_id) const {
  for (const auto &task : pending_) {
    if (task.task_id == task_id) {
      return true;
    }
  }
  for (const auto &task : running_) {
    if (task.task_id == task_id) {
      return true;
    }
  }
  return false;
}

std::vector<QueuedTask>::iterator
TaskQueue::find_running_locked(const std::string &id) {
  for (auto it = running_.begin(); it != running_.end(); ++it) {
    if (it->task_id == id) {
      return it;
    }
  }
  return running_.end();
}

Result<std::string, TaskError> TaskQueue::validate_new_task_locked(
    const std::unique_ptr<IJob> &job,
    const std::optional<std::string> &requested_id) const {
  if (stopping_) {
    return Result<std::string, TaskError>::Err(
        TaskError::Internal("Task queue is shutting down"));
  }
  if (!job) {
    return Result<std::string, TaskError>::Err(
        TaskError::InvalidArgument("Job must not be null"));
  }
  if (requested_id.has_value()) {
    if (requested_id->empty()) {
      return Result<std::string, TaskError>::Err(
          TaskError::InvalidArgument("task_id must not be empty"));
    }
    if (contains_locked(*requested_id)) {
      return Result<std::string, TaskError>::Err(
          TaskError::Duplicate(*requested_id));
    }
    return Result<std::string, TaskError>::Ok(*requested_id);
  }

  std::string id = generate_task_id();
  while (contains_locked(id)) {
    id = generate_task_id();
  }
  return Result<std::string, TaskError>::Ok(std::move(id));
}

Result<std::string, TaskError> TaskQueue::enqueue(JobKind kind,
                                                  std::unique_ptr<IJob> job,
                                                  EnqueueOptions options) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = validate_new_task_locked(job, options.task_id);
  if (id.is_err()) {
    return id;
  }

  QueuedTask task = QueuedTask::create(id.value(), kind, std::move(job),
                                       options.priority,
                                       std::move(options.owner));

  // First slot whose priority is strictly lower keeps FIFO among equals.
  std::size_t index = 0;
  while (index < pending_.size() && pending_[index].priority >= task.priority) {
    ++index;
  }

  TaskQueuedData data;
  data.task_id = task.task_id;
  data.kind = task.kind;
  data.estimated_cpu_cores = task.estimated_cpu_cores;
  data.estimated_ram_gb = task.estimated_ram_gb;
  data.queue_position = index + 1;
  data.description = task.description;

  pending_.insert(pending_.begin() + static_cast<std::ptrdiff_t>(index),
                  std::move(task));
  bus_.publish(EventType::TaskQueued, data);

  if (logger_) {
    logger_->info(data.task_id, kComponent, "queued",
                  std::string(to_string(kind)) + " at position " +
                      std::to_string(data.queue_position) + " of " +
                      std::to_string(pending_.size()) + ", priority " +
                      std::to_string(options.priority));
  }
  return id;
}

std::optional<std::string> TaskQueue::try_execute_next() {
  std::string head_id;
  JobKind head_kind = JobKind::Backtest;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || !monitor_ || pending_.empty()) {
      return std::nullopt;
    }
    head_id = pending_.front().task_id;
    head_kind = pending_.front().kind;
  }

  // Sampling can block; the queue stays open for other callers meanwhile.
  const AdmissionDecision decision = monitor_->can_run_task(head_kind);
  if (!decision.admitted) {
    if (logger_) {
      logger_->debug(head_id, kComponent, "head_blocked", decision.reason);
    }
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (stopping_) {
    return std::nullopt;
  }
  // The decision was made for head_id; a task enqueued ahead of it since then
  // waits for the next call.
  for (auto it = pending_.begin(); it != pending_.end(); ++it) {
    if (it->task_id == head_id) {
      QueuedTask task = std::move(*it);
      pending_.erase(it);
      start_locked(std::move(task));
      return head_id;
    }
  }
  return std::nullopt;
}

Result<std::string, TaskError>
TaskQueue::register_running_task(JobKind kind, std::unique_ptr<IJob> job,
                                 EnqueueOptions options) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = validate_new_task_locked(job, options.task_id);
  if (id.is_err()) {
    return id;
  }

  start_locked(QueuedTask::create(id.value(), kind, std::move(job), 0,
                                  std::move(options.owner)));
  return id;
}

void TaskQueue::start_locked(QueuedTask task) {
  auto to_running = task.transition_to(TaskState::Running);
  if (to_running.is_err()) {
    if (logger_) {
      logger_->error(task.task_id, kComponent, "start_rejected",
                     to_running.error().internal_message);
    }
    return;
  }

  TaskRunningData data;
  data.task_id = task.task_id;
  data.kind = task.kind;
  data.estimated_cpu_cores = task.estimated_cpu_cores;
  data.estimated_ram_gb = task.estimated_ram_gb;

  const std::string id = task.task_id;
  running_.push_back(std::move(task));
  bus_.publish(EventType::TaskRunning, data);

  if (logger_) {
    logger_->info(id, kComponent, "running",
                  std::string(to_string(data.kind)) + ", " +
                      std::to_string(running_.size()) + " running");
  }

  auto launched = executor_.launch(id, [this, id]() { execute(id); });
  if (launched.is_err()) {
    if (logger_) {
      logger_->error(id, kComponent, "launch_failed",
                     launched.error().internal_message);
    }
    auto it = find_running_locked(id);
    if (it != running_.end()) {
      TaskCompletedData done{id, it->kind, false};
      running_.erase(it);
      bus_.publish(EventType::TaskCompleted, done);
    }
  }
}

void TaskQueue::execute(const std::string &task_id) {
  IJob *job = nullptr;
  JobContext ctx;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_running_locked(task_id);
    if (it == running_.end()) {
      return;
    }
    job = it->job.get();
    ctx.task_id = task_id;
    ctx.kind = it->kind;
    ctx.owner = it->owner;
  }
  ctx.report = [this, task_id](const std::string &text) {
    update_task_description(task_id, text);
  };

  if (logger_) {
    logger_->info(task_id, kComponent, "executing",
                  job->name() + " (" + to_string(ctx.kind) + ")");
  }

  bool success = false;
  try {
    auto result = job->execute(ctx);
    if (result.is_ok()) {
      success = true;
      if (logger_) {
        logger_->info(task_id, kComponent, "completed", job->name());
      }
    } else if (logger_) {
      logger_->error(task_id, kComponent, "failed",
                     std::string(to_string(result.error().category)) + ": " +
                         result.error().internal_message);
    }
  } catch (const std::exception &e) {
    if (logger_) {
      logger_->error(task_id, kComponent, "failed",
                     std::string("exception: ") + e.what());
    }
  } catch (...) {
    // Reported as success=false below; the job thread must not terminate.
    if (logger_) {
      logger_->error(task_id, kComponent, "failed", "non-standard exception");
    }
  }

  finish(task_id, success);
}

void TaskQueue::finish(const std::string &task_id, bool success) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_running_locked(task_id);
  if (it == running_.end()) {
    return;
  }

  auto to_finished = it->transition_to(TaskState::Finished);
  if (to_finished.is_err() && logger_) {
    logger_->error(task_id, kComponent, "finish_state",
                   to_finished.error().internal_message);
  }

  TaskCompletedData data{task_id, it->kind, success};
  running_.erase(it);
  bus_.publish(EventType::TaskCompleted, data);

  if (logger_) {
    logger_->info(task_id, kComponent, "removed",
                  std::to_string(running_.size()) + " still running");
  }
}

QueueStatus
TaskQueue::get_queue_status(const std::optional<std::string> &owner) const {
  std::lock_guard<std::mutex> lock(mutex_);
  QueueStatus status;

  std::size_t position = 0;
  for (const auto &task : pending_) {
    ++position;
    if (owner.has_value() && task.owner != *owner) {
      continue;
    }
    QueuedTaskInfo info;
    info.task_id = task.task_id;
    info.kind = task.kind;
    info.priority = task.priority;
    info.queued_at = task.queued_at;
    info.estimated_cpu_cores = task.estimated_cpu_cores;
    info.estimated_ram_gb = task.estimated_ram_gb;
    info.queue_position = position;
    info.description = task.description;
    info.owner = task.owner;
    status.queued_tasks.push_back(std::move(info));
  }

  for (const auto &task : running_) {
    if (owner.has_value() && task.owner != *owner) {
      continue;
    }
    RunningTaskInfo info;
    info.task_id = task.task_id;
    info.kind = task.kind;
    info.estimated_cpu_cores = task.estimated_cpu_cores;
    info.estimated_ram_gb = task.estimated_ram_gb;
    info.description = task.description;
    info.owner = task.owner;
    status.running_tasks.push_back(std::move(info));
  }

  status.queued_count = status.queued_tasks.size();
  status.running_count = status.running_tasks.size();
  return status;
}

std::optional<std::size_t>
TaskQueue::get_task_position(const std::string &task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < pending_.size(); ++i) {
    if (pending_[i].task_id == task_id) {
      return i + 1;
    }
  }
  return std::nullopt;
}

void TaskQueue::update_task_description(const std::string &task_id,
                                        const std::string &description) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_running_locked(task_id);
  if (it == running_.end()) {
    return; // finished already, or never ran
  }
  it->description = description;
  bus_.publish(EventType::TaskDescriptionUpdate,
               TaskDescriptionData{task_id, it->kind, description});

  if (logger_) {
    logger_->debug(task_id, kComponent, "description", description);
  }
}

std::shared_ptr<EventChannel>
TaskQueue::subscribe_to_events(std::optional<std::size_t> capacity) {
  return capacity.has_value() ? bus_.subscribe(*capacity) : bus_.subscribe();
}

void TaskQueue::unsubscribe_from_events(
    const std::shared_ptr<EventChannel> &channel) {
  bus_.unsubscribe(channel);
}

bool TaskQueue::has_active_tasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !pending_.empty() || !running_.empty();
}

} // namespace tg::core
