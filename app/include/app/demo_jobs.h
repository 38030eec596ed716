#pragma once

#include "core/task.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace tg::app {

/// Stand-in for a backtest / training / prediction adapter: sleeps through
/// `steps` steps and reports "<label>: step i/n" after each one. With
/// `fail_at_step` set the job returns an Execution error at that step.
class SimulatedJob : public core::IJob {
public:
  SimulatedJob(std::string label, int steps,
               std::chrono::milliseconds step_duration,
               std::optional<int> fail_at_step = std::nullopt);

  [[nodiscard]] std::string name() const override { return label_; }

  core::Result<void, core::TaskError> execute(core::JobContext &ctx) override;

private:
  std::string label_;
  int steps_;
  std::chrono::milliseconds step_duration_;
  std::optional<int> fail_at_step_;
};

/// Demo workload: the i-th job of a batch, cycling through the three kinds.
struct DemoJob {
  core::JobKind kind;
  int priority;
  std::unique_ptr<core::IJob> job;
};

DemoJob make_demo_job(int index);

} // namespace tg::app
