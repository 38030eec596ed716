#include "app/demo_jobs.h"

#include "core/task_error.h"

#include <thread>

namespace tg::app {

SimulatedJob::SimulatedJob(std::string label, int steps,
                           std::chrono::milliseconds step_duration,
                           std::optional<int> fail_at_step)
    : label_(std::move(label)), steps_(steps), step_duration_(step_duration),
      fail_at_step_(fail_at_step) {}

core::Result<void, core::TaskError>
SimulatedJob::execute(core::JobContext &ctx) {
  if (steps_ <= 0) {
    return core::Result<void, core::TaskError>::Err(
        core::TaskError::InvalidArgument("step count must be positive"));
  }

  for (int step = 1; step <= steps_; ++step) {
    std::this_thread::sleep_for(step_duration_);
    if (fail_at_step_ && *fail_at_step_ == step) {
      return core::Result<void, core::TaskError>::Err(core::TaskError::Execution(
          label_ + " failed at step " + std::to_string(step)));
    }
    ctx.describe(label_ + ": step " + std::to_string(step) + "/" +
                 std::to_string(steps_));
  }
  return core::Result<void, core::TaskError>::Ok();
}

DemoJob make_demo_job(int index) {
  static const core::JobKind kinds[] = {core::JobKind::Backtest,
                                        core::JobKind::ModelTraining,
                                        core::JobKind::Prediction};
  const core::JobKind kind = kinds[index % 3];
  const int steps = 3 + index % 4;
  const auto step = std::chrono::milliseconds(300 + 100 * (index % 3));

  // Every fifth job fails halfway to exercise the failure path.
  std::optional<int> fail_at;
  if (index % 5 == 4) {
    fail_at = steps / 2 + 1;
  }

  DemoJob demo;
  demo.kind = kind;
  demo.priority = index % 3 == 1 ? 5 : 0;
  demo.job = std::make_unique<SimulatedJob>(
      std::string(core::to_string(kind)) + " #" + std::to_string(index + 1),
      steps, step, fail_at);
  return demo;
}

} // namespace tg::app
