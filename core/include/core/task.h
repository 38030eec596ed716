#pragma once

#include "core/result.h"
#include "core/task_error.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tg::core {

// ---- Job kinds and their nominal footprint ----

enum class JobKind {
  Backtest,      // Strategy backtest run
  ModelTraining, // Gradient-boosted model training
  Prediction     // Inference with a trained model
};

/// Wire name: "backtest", "model_training", "prediction".
const char *to_string(JobKind kind);

/// Inverse of to_string(JobKind). Err(InvalidArgument) on unknown names.
Result<JobKind, TaskError> parse_job_kind(const std::string &name);

/// Expected worst-case footprint of one job of a given kind.
struct ResourceRequirement {
  double cpu_cores = 0.0;
  double ram_gb = 0.0;
};

/// Process-wide constant table:
///   Backtest       1.0 core, 0.5 GB
///   ModelTraining  2.0 cores, 1.5 GB
///   Prediction     0.5 core, 0.3 GB
const ResourceRequirement &requirement_for(JobKind kind);

// ---- Unit of work ----

/// Passed to IJob::execute. Lets a running job publish progress text.
struct JobContext {
  std::string task_id;
  JobKind kind = JobKind::Backtest;
  std::string owner;

  /// Updates the task description and broadcasts task_description_update.
  /// Safe to call from the job's own thread; no-op once the task finished.
  std::function<void(const std::string &)> report;

  void describe(const std::string &text) const {
    if (report) {
      report(text);
    }
  }
};

/// A job adapter (backtest, training, prediction) submitted to the queue.
/// execute() runs on a dedicated thread; it may return Err or throw, both are
/// reported as a failed completion.
class IJob {
public:
  virtual ~IJob() = default;

  [[nodiscard]] virtual std::string name() const = 0;

  virtual Result<void, TaskError> execute(JobContext &ctx) = 0;
};

// ---- Task lifecycle ----

enum class TaskState {
  Pending,  // In the pending collection, waiting for admission
  Running,  // In the running set, job executing
  Finished  // Job returned or threw; about to be dropped
};

const char *to_string(TaskState state);

/// One unit of pending or running work. Owned exclusively by TaskQueue.
struct QueuedTask {
  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;

  std::string task_id;
  JobKind kind = JobKind::Backtest;
  std::unique_ptr<IJob> job;
  int priority = 0;
  std::string owner;
  std::string description;

  TimePoint queued_at = Clock::now();
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> finished_at;

  double estimated_cpu_cores = 0.0;
  double estimated_ram_gb = 0.0;

  TaskState state = TaskState::Pending;

  /// Builds a pending task with the estimates copied from requirement_for().
  static QueuedTask create(std::string task_id, JobKind kind,
                           std::unique_ptr<IJob> job, int priority = 0,
                           std::string owner = {});

  /// Legal transitions: Pending -> Running, Running -> Finished.
  Result<void, TaskError> transition_to(TaskState new_state);
};

/// Random RFC 4122 version-4 identifier, used when the caller supplies none.
std::string generate_task_id();

} // namespace tg::core
