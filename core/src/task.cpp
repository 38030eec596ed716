#include "core/task.h"

#include <array>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>

namespace tg::core {

namespace {

const ResourceRequirement kBacktestRequirement{1.0, 0.5};
const ResourceRequirement kModelTrainingRequirement{2.0, 1.5};
const ResourceRequirement kPredictionRequirement{0.5, 0.3};

} // namespace

const char *to_string(JobKind kind) {
  switch (kind) {
  case JobKind::Backtest:
    return "backtest";
  case JobKind::ModelTraining:
    return "model_training";
  case JobKind::Prediction:
    return "prediction";
  }
  return "unknown";
}

Result<JobKind, TaskError> parse_job_kind(const std::string &name) {
  for (auto kind :
       {JobKind::Backtest, JobKind::ModelTraining, JobKind::Prediction}) {
    if (name == to_string(kind)) {
      return Result<JobKind, TaskError>::Ok(kind);
    }
  }
  return Result<JobKind, TaskError>::Err(
      TaskError::InvalidArgument("Unknown job kind: " + name));
}

const ResourceRequirement &requirement_for(JobKind kind) {
  switch (kind) {
  case JobKind::Backtest:
    return kBacktestRequirement;
  case JobKind::ModelTraining:
    return kModelTrainingRequirement;
  case JobKind::Prediction:
    return kPredictionRequirement;
  }
  return kBacktestRequirement;
}

const char *to_string(TaskState state) {
  switch (state) {
  case TaskState::Pending:
    return "Pending";
  case TaskState::Running:
    return "Running";
  case TaskState::Finished:
    return "Finished";
  }
  return "Unknown";
}

QueuedTask QueuedTask::create(std::string task_id, JobKind kind,
                              std::unique_ptr<IJob> job, int priority,
                              std::string owner) {
  QueuedTask task;
  task.task_id = std::move(task_id);
  task.kind = kind;
  task.job = std::move(job);
  task.priority = priority;
  task.owner = std::move(owner);

  const auto &req = requirement_for(kind);
  task.estimated_cpu_cores = req.cpu_cores;
  task.estimated_ram_gb = req.ram_gb;
  return task;
}

Result<void, TaskError> QueuedTask::transition_to(TaskState new_state) {
  const bool legal =
      (state == TaskState::Pending && new_state == TaskState::Running) ||
      (state == TaskState::Running && new_state == TaskState::Finished);

  if (!legal) {
    return Result<void, TaskError>::Err(TaskError::Internal(
        std::string("Illegal state transition: ") + to_string(state) + " -> " +
        to_string(new_state) + " (task_id=" + task_id + ")"));
  }

  state = new_state;
  if (new_state == TaskState::Running) {
    started_at = Clock::now();
  } else {
    finished_at = Clock::now();
  }
  return Result<void, TaskError>::Ok();
}

std::string generate_task_id() {
  static std::mutex rng_mutex;
  static std::mt19937_64 rng{std::random_device{}()};

  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lock(rng_mutex);
    hi = rng();
    lo = rng();
  }

  // Version 4, variant 10xx.
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::array<char, 37> buf{};
  std::snprintf(buf.data(), buf.size(), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buf.data());
}

} // namespace tg::core
