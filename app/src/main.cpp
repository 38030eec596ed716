#include "app/demo_jobs.h"
#include "core/logger.h"
#include "core/runtime.h"
#include "infra/config.h"
#include "infra/event_stream.h"
#include "infra/logger.h"
#include "infra/resource_sampler.h"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_signal(int) { g_interrupted = 1; }

std::shared_ptr<tg::core::ILogger> to_shared(
    std::unique_ptr<tg::core::ILogger> logger) {
  return std::shared_ptr<tg::core::ILogger>(logger.release());
}

void submit_demo_jobs(tg::core::SchedulerRuntime &runtime, int count,
                      const std::shared_ptr<tg::core::ILogger> &logger) {
  for (int i = 0; i < count; ++i) {
    auto demo = tg::app::make_demo_job(i);
    tg::core::EnqueueOptions options;
    options.priority = demo.priority;
    options.owner = "demo";

    auto submitted = runtime.submit(demo.kind, std::move(demo.job),
                                    std::move(options), "Starting");
    if (submitted.is_err()) {
      logger->error("-", "app", "submit_failed",
                    submitted.error().user_message);
      continue;
    }
    const auto &s = submitted.value();
    if (s.started) {
      logger->info(s.task_id, "app", "submitted_running", s.reason);
    } else {
      logger->info(s.task_id, "app", "submitted_queued",
                   "position=" + std::to_string(s.queue_position.value_or(0)) +
                       " reason=" + s.reason);
    }
  }
}

} // namespace

int main() {
  auto bootstrap = to_shared(tg::infra::create_console_logger());
  const auto config = tg::infra::AppConfig::from_environment(bootstrap);
  auto logger = to_shared(tg::infra::create_console_logger(config.log_level));

  logger->info("startup", "app", "config",
               std::string("dev_mode=") + (config.dev_mode ? "true" : "false") +
                   " log_level=" + tg::infra::to_string(config.log_level) +
                   " demo_jobs=" + std::to_string(config.demo_jobs));

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  tg::core::SchedulerRuntime runtime(config.runtime_config(),
                                     tg::infra::create_host_sampler(), logger);
  runtime.start();

  tg::infra::EventStreamSession stream(
      runtime.queue(),
      [](const std::string &frame) {
        std::cout << frame << std::flush;
        return static_cast<bool>(std::cout);
      },
      logger);
  std::thread stream_thread([&stream] { stream.run(); });

  submit_demo_jobs(runtime, config.demo_jobs, logger);

  while (!g_interrupted && runtime.queue().has_active_tasks()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  if (g_interrupted) {
    logger->warn("shutdown", "app", "interrupted",
                 "Signal received, waiting for running jobs");
  }

  runtime.shutdown();
  stream.stop();
  stream_thread.join();

  logger->info("shutdown", "app", "done", "taskgated stopped");
  return 0;
}
