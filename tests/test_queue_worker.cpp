#include <gtest/gtest.h>

#include "core/queue_worker.h"
#include "core/task_queue.h"
#include "test_support.h"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace tg::core;
using namespace tg::testing;

namespace {

struct Harness {
  std::shared_ptr<FakeSampler> sampler = std::make_shared<FakeSampler>();
  std::shared_ptr<ResourceMonitor> monitor = std::make_shared<ResourceMonitor>(
      MonitorProfile::production(), sampler);
  TaskQueue queue{monitor};
};

EnqueueOptions named(const std::string &id) {
  EnqueueOptions options;
  options.task_id = id;
  return options;
}

} // namespace

TEST(QueueWorker, NonPositiveIntervalFallsBackToDefault) {
  Harness h;
  QueueWorker worker(h.queue, std::chrono::milliseconds(0));
  ASSERT_EQ(worker.interval(), QueueWorker::kDefaultInterval);
  ASSERT_EQ(QueueWorker::kDefaultInterval, std::chrono::milliseconds(5000));
}

TEST(QueueWorker, TickPromotesAtMostOneTask) {
  Harness h;
  auto gate = std::make_shared<Gate>();
  for (int i = 0; i < 3; ++i) {
    h.queue.enqueue(JobKind::Prediction, gated_job(gate),
                    named("t" + std::to_string(i)));
  }

  QueueWorker worker(h.queue, std::chrono::milliseconds(1000));
  auto promoted = worker.tick();
  ASSERT_TRUE(promoted.has_value());
  ASSERT_EQ(*promoted, "t0");

  auto status = h.queue.get_queue_status();
  ASSERT_EQ(status.running_count, 1u);
  ASSERT_EQ(status.queued_count, 2u);
  gate->open();
}

TEST(QueueWorker, TickWithInsufficientResourcesLeavesQueueAlone) {
  Harness h;
  h.sampler->set_cpu_percent(100.0);
  h.queue.enqueue(JobKind::Backtest, quick_job(), named("blocked"));

  QueueWorker worker(h.queue, std::chrono::milliseconds(1000));
  ASSERT_FALSE(worker.tick().has_value());
  ASSERT_EQ(h.queue.get_task_position("blocked"), 1u);
}

TEST(QueueWorker, StartStopLifecycle) {
  Harness h;
  QueueWorker worker(h.queue, std::chrono::milliseconds(10));

  ASSERT_FALSE(worker.is_running());
  ASSERT_TRUE(worker.start());
  ASSERT_TRUE(worker.is_running());
  ASSERT_FALSE(worker.start());

  worker.stop();
  ASSERT_FALSE(worker.is_running());
  worker.stop(); // idempotent
}

TEST(QueueWorker, ConcurrentStopsJoinOnce) {
  Harness h;
  QueueWorker worker(h.queue, std::chrono::milliseconds(60000));
  ASSERT_TRUE(worker.start());

  std::vector<std::thread> stoppers;
  for (int i = 0; i < 4; ++i) {
    stoppers.emplace_back([&worker]() { worker.stop(); });
  }
  for (auto &t : stoppers) {
    t.join();
  }
  ASSERT_FALSE(worker.is_running());
}

TEST(QueueWorker, RestartsAfterStop) {
  Harness h;
  auto gate = std::make_shared<Gate>();
  h.queue.enqueue(JobKind::Backtest, gated_job(gate), named("first"));

  QueueWorker worker(h.queue, std::chrono::milliseconds(10));
  ASSERT_TRUE(worker.start());
  ASSERT_TRUE(wait_until([&]() { return !h.queue.get_task_position("first"); }));
  worker.stop();

  // Nothing promotes while stopped.
  h.queue.enqueue(JobKind::Backtest, gated_job(gate), named("second"));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  ASSERT_EQ(h.queue.get_task_position("second"), 1u);

  ASSERT_TRUE(worker.start());
  ASSERT_TRUE(worker.is_running());
  ASSERT_TRUE(
      wait_until([&]() { return !h.queue.get_task_position("second"); }));
  worker.stop();
  ASSERT_FALSE(worker.is_running());
  gate->open();
}

TEST(QueueWorker, StopReturnsWithoutWaitingForInterval) {
  Harness h;
  QueueWorker worker(h.queue, std::chrono::milliseconds(60000));
  ASSERT_TRUE(worker.start());

  const auto begin = std::chrono::steady_clock::now();
  worker.stop();
  ASSERT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}

TEST(QueueWorker, QueuedTaskRunsOnceResourcesFree) {
  Harness h;
  h.sampler->set_cpu_percent(100.0);
  auto channel = h.queue.subscribe_to_events();
  h.queue.enqueue(JobKind::Backtest, quick_job(), named("later"));

  QueueWorker worker(h.queue, std::chrono::milliseconds(20));
  ASSERT_TRUE(worker.start());

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  ASSERT_EQ(h.queue.get_task_position("later"), 1u);

  h.sampler->set_cpu_percent(10.0);
  auto events = collect_until(*channel, [](const std::vector<Event> &evs) {
    return count_of(evs, EventType::TaskCompleted, "later") > 0;
  });
  worker.stop();

  ASSERT_EQ(count_of(events, EventType::TaskQueued, "later"), 1u);
  ASSERT_EQ(count_of(events, EventType::TaskRunning, "later"), 1u);
  ASSERT_EQ(count_of(events, EventType::TaskCompleted, "later"), 1u);
  ASSERT_FALSE(h.queue.has_active_tasks());
}
