#include "core/runtime.h"

#include "core/logger.h"

#include <utility>

namespace tg::core {

namespace {
constexpr const char *kComponent = "runtime";
} // namespace

SchedulerRuntime::SchedulerRuntime(RuntimeConfig config,
                                   std::shared_ptr<IResourceSampler> sampler,
                                   std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)),
      monitor_(std::make_shared<ResourceMonitor>(config.profile,
                                                 std::move(sampler), logger_)),
      queue_(std::make_unique<TaskQueue>(monitor_, logger_, config.queue)),
      worker_(std::make_unique<QueueWorker>(*queue_, config.worker_interval,
                                            logger_)) {}

SchedulerRuntime::~SchedulerRuntime() { shutdown(); }

void SchedulerRuntime::start() { worker_->start(); }

void SchedulerRuntime::shutdown() {
  worker_->stop();
  queue_->shutdown();
}

Result<Submission, TaskError>
SchedulerRuntime::submit(JobKind kind, std::unique_ptr<IJob> job,
                         EnqueueOptions options,
                         const std::optional<std::string> &initial_description) {
  const AdmissionDecision decision = monitor_->can_run_task(kind);

  Submission submission;
  submission.reason = decision.reason;

  if (decision.admitted) {
    auto id = queue_->register_running_task(kind, std::move(job),
                                            std::move(options));
    if (id.is_err()) {
      return Result<Submission, TaskError>::Err(id.error());
    }
    submission.task_id = id.value();
    submission.started = true;
    if (initial_description.has_value()) {
      queue_->update_task_description(submission.task_id,
                                      *initial_description);
    }
    return Result<Submission, TaskError>::Ok(std::move(submission));
  }

  if (logger_) {
    logger_->info(options.task_id.value_or("-"), kComponent,
                  "insufficient_resources", decision.reason);
  }
  auto id = queue_->enqueue(kind, std::move(job), std::move(options));
  if (id.is_err()) {
    return Result<Submission, TaskError>::Err(id.error());
  }
  submission.task_id = id.value();
  submission.queue_position = queue_->get_task_position(submission.task_id);
  return Result<Submission, TaskError>::Ok(std::move(submission));
}

} // namespace tg::core
