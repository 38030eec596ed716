#include <gtest/gtest.h>

#include "core/task_queue.h"
#include "test_support.h"

#include <algorithm>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace tg::core;
using namespace tg::testing;

namespace {

class TaskQueueTest : public ::testing::Test {
protected:
  void SetUp() override {
    sampler_ = std::make_shared<FakeSampler>(8, 16 * kGiB);
    monitor_ = std::make_shared<ResourceMonitor>(MonitorProfile::production(),
                                                 sampler_);
    queue_ = std::make_unique<TaskQueue>(monitor_);
    gate_ = std::make_shared<Gate>();
  }

  void TearDown() override {
    gate_->open();
    queue_.reset();
  }

  EnqueueOptions with_id(const std::string &id, int priority = 0,
                         const std::string &owner = {}) {
    EnqueueOptions options;
    options.task_id = id;
    options.priority = priority;
    options.owner = owner;
    return options;
  }

  std::vector<std::string> pending_ids() const {
    std::vector<std::string> ids;
    for (const auto &task : queue_->get_queue_status().queued_tasks) {
      ids.push_back(task.task_id);
    }
    return ids;
  }

  std::shared_ptr<FakeSampler> sampler_;
  std::shared_ptr<ResourceMonitor> monitor_;
  std::unique_ptr<TaskQueue> queue_;
  std::shared_ptr<Gate> gate_;
};

} // namespace

// ============================================================
// Test: Enqueue and ordering
// ============================================================

TEST_F(TaskQueueTest, HigherPriorityFirstFifoAmongEquals) {
  ASSERT_TRUE(queue_->enqueue(JobKind::Backtest, quick_job(), with_id("a", 0))
                  .is_ok());
  ASSERT_TRUE(queue_->enqueue(JobKind::Backtest, quick_job(), with_id("b", 5))
                  .is_ok());
  ASSERT_TRUE(queue_->enqueue(JobKind::Backtest, quick_job(), with_id("c", 0))
                  .is_ok());
  ASSERT_TRUE(queue_->enqueue(JobKind::Backtest, quick_job(), with_id("d", 5))
                  .is_ok());

  ASSERT_EQ(pending_ids(), (std::vector<std::string>{"b", "d", "a", "c"}));
  ASSERT_EQ(queue_->get_task_position("b"), 1u);
  ASSERT_EQ(queue_->get_task_position("c"), 4u);
  ASSERT_FALSE(queue_->get_task_position("missing").has_value());

  auto status = queue_->get_queue_status();
  ASSERT_EQ(status.queued_count, 4u);
  ASSERT_EQ(status.running_count, 0u);
  for (std::size_t i = 0; i < status.queued_tasks.size(); ++i) {
    ASSERT_EQ(status.queued_tasks[i].queue_position, i + 1);
  }
}

TEST_F(TaskQueueTest, EnqueueGeneratesIdAndCopiesEstimates) {
  auto id = queue_->enqueue(JobKind::ModelTraining, quick_job());
  ASSERT_TRUE(id.is_ok());
  ASSERT_EQ(id.value().size(), 36u);

  auto status = queue_->get_queue_status();
  ASSERT_EQ(status.queued_tasks.size(), 1u);
  ASSERT_EQ(status.queued_tasks[0].task_id, id.value());
  ASSERT_DOUBLE_EQ(status.queued_tasks[0].estimated_cpu_cores, 2.0);
  ASSERT_DOUBLE_EQ(status.queued_tasks[0].estimated_ram_gb, 1.5);
}

TEST_F(TaskQueueTest, QueuedEventReportsInsertionPosition) {
  auto channel = queue_->subscribe_to_events();
  queue_->enqueue(JobKind::Backtest, quick_job(), with_id("low", 0));
  queue_->enqueue(JobKind::Prediction, quick_job(), with_id("high", 9));

  auto events = collect_count(*channel, 2);
  ASSERT_EQ(events.size(), 2u);
  ASSERT_EQ(events[1].type, EventType::TaskQueued);
  const auto &data = std::get<TaskQueuedData>(events[1].data);
  ASSERT_EQ(data.task_id, "high");
  ASSERT_EQ(data.queue_position, 1u);
  ASSERT_DOUBLE_EQ(data.estimated_cpu_cores, 0.5);
  ASSERT_TRUE(events[1].resources.has_value());
}

TEST_F(TaskQueueTest, DuplicateIdRejected) {
  ASSERT_TRUE(
      queue_->enqueue(JobKind::Backtest, gated_job(gate_), with_id("dup"))
          .is_ok());

  auto again = queue_->enqueue(JobKind::Backtest, quick_job(), with_id("dup"));
  ASSERT_TRUE(again.is_err());
  ASSERT_EQ(again.error().category, ErrorCategory::Duplicate);

  auto direct =
      queue_->register_running_task(JobKind::Backtest, quick_job(), with_id("dup"));
  ASSERT_TRUE(direct.is_err());
  ASSERT_EQ(direct.error().category, ErrorCategory::Duplicate);

  ASSERT_EQ(queue_->get_queue_status().queued_count, 1u);
}

TEST_F(TaskQueueTest, NullJobAndEmptyIdRejected) {
  auto null_job = queue_->enqueue(JobKind::Backtest, nullptr);
  ASSERT_TRUE(null_job.is_err());
  ASSERT_EQ(null_job.error().category, ErrorCategory::InvalidArgument);

  auto empty_id = queue_->enqueue(JobKind::Backtest, quick_job(), with_id(""));
  ASSERT_TRUE(empty_id.is_err());
  ASSERT_EQ(empty_id.error().category, ErrorCategory::InvalidArgument);

  ASSERT_FALSE(queue_->has_active_tasks());
}

// ============================================================
// Test: Promotion
// ============================================================

TEST_F(TaskQueueTest, TryExecuteNextPromotesHeadOnly) {
  queue_->enqueue(JobKind::Backtest, gated_job(gate_), with_id("first"));
  queue_->enqueue(JobKind::Backtest, gated_job(gate_), with_id("second"));

  auto promoted = queue_->try_execute_next();
  ASSERT_TRUE(promoted.has_value());
  ASSERT_EQ(*promoted, "first");

  auto status = queue_->get_queue_status();
  ASSERT_EQ(status.running_count, 1u);
  ASSERT_EQ(status.running_tasks[0].task_id, "first");
  ASSERT_EQ(status.queued_count, 1u);
  ASSERT_EQ(status.queued_tasks[0].task_id, "second");
  ASSERT_EQ(status.queued_tasks[0].queue_position, 1u);
}

TEST_F(TaskQueueTest, EmptyQueueDoesNotSample) {
  const int before = sampler_->calls();
  ASSERT_FALSE(queue_->try_execute_next().has_value());
  ASSERT_EQ(sampler_->calls(), before);
}

TEST_F(TaskQueueTest, RejectedHeadBlocksEverythingBehindIt) {
  sampler_->set_cpu_percent(75.0); // 2.0 cores free
  queue_->enqueue(JobKind::ModelTraining, quick_job(), with_id("big"));
  queue_->enqueue(JobKind::Prediction, quick_job(), with_id("small"));

  ASSERT_FALSE(queue_->try_execute_next().has_value());
  ASSERT_EQ(pending_ids(), (std::vector<std::string>{"big", "small"}));
  ASSERT_EQ(queue_->get_queue_status().running_count, 0u);

  sampler_->set_cpu_percent(0.0);
  auto promoted = queue_->try_execute_next();
  ASSERT_TRUE(promoted.has_value());
  ASSERT_EQ(*promoted, "big");
}

TEST_F(TaskQueueTest, SamplingFailureKeepsTasksPending) {
  queue_->enqueue(JobKind::Prediction, quick_job(), with_id("p"));
  sampler_->set_failing(true);

  ASSERT_FALSE(queue_->try_execute_next().has_value());
  ASSERT_EQ(queue_->get_task_position("p"), 1u);
  sampler_->set_failing(false);
}

TEST_F(TaskQueueTest, RegisterRunningTaskSkipsPendingCollection) {
  auto channel = queue_->subscribe_to_events();
  auto id = queue_->register_running_task(JobKind::Prediction, gated_job(gate_),
                                          with_id("direct", 0, "alice"));
  ASSERT_TRUE(id.is_ok());

  auto status = queue_->get_queue_status();
  ASSERT_EQ(status.queued_count, 0u);
  ASSERT_EQ(status.running_count, 1u);
  ASSERT_EQ(status.running_tasks[0].owner, "alice");

  gate_->open();
  auto events = collect_count(*channel, 2);
  ASSERT_EQ(events.size(), 2u);
  ASSERT_EQ(events[0].type, EventType::TaskRunning);
  ASSERT_EQ(events[1].type, EventType::TaskCompleted);
  ASSERT_TRUE(std::get<TaskCompletedData>(events[1].data).success);
}

TEST_F(TaskQueueTest, TaskIsNeverPendingAndRunningAtOnce) {
  for (int i = 0; i < 5; ++i) {
    queue_->enqueue(JobKind::Prediction, gated_job(gate_),
                    with_id("t" + std::to_string(i)));
  }
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(queue_->try_execute_next().has_value());
  }

  auto status = queue_->get_queue_status();
  ASSERT_EQ(status.queued_count, 2u);
  ASSERT_EQ(status.running_count, 3u);
  for (const auto &running : status.running_tasks) {
    for (const auto &queued : status.queued_tasks) {
      ASSERT_NE(running.task_id, queued.task_id);
    }
  }
}

// ============================================================
// Test: Status filtering and descriptions
// ============================================================

TEST_F(TaskQueueTest, OwnerFilterKeepsGlobalPositions) {
  queue_->enqueue(JobKind::Backtest, quick_job(), with_id("a1", 0, "alice"));
  queue_->enqueue(JobKind::Backtest, quick_job(), with_id("b1", 0, "bob"));
  queue_->enqueue(JobKind::Backtest, quick_job(), with_id("a2", 0, "alice"));

  auto alice = queue_->get_queue_status(std::string("alice"));
  ASSERT_EQ(alice.queued_count, 2u);
  ASSERT_EQ(alice.queued_tasks[0].task_id, "a1");
  ASSERT_EQ(alice.queued_tasks[0].queue_position, 1u);
  ASSERT_EQ(alice.queued_tasks[1].task_id, "a2");
  ASSERT_EQ(alice.queued_tasks[1].queue_position, 3u);

  auto nobody = queue_->get_queue_status(std::string("carol"));
  ASSERT_EQ(nobody.queued_count, 0u);
  ASSERT_EQ(queue_->get_queue_status().queued_count, 3u);
}

TEST_F(TaskQueueTest, DescriptionUpdateOnlyForRunningTasks) {
  auto channel = queue_->subscribe_to_events();
  queue_->register_running_task(JobKind::Backtest, gated_job(gate_),
                                with_id("run"));
  queue_->enqueue(JobKind::Backtest, quick_job(), with_id("wait"));

  queue_->update_task_description("wait", "ignored");
  queue_->update_task_description("unknown", "ignored");
  queue_->update_task_description("run", "Loading data");

  auto status = queue_->get_queue_status();
  ASSERT_EQ(status.running_tasks[0].description, "Loading data");
  ASSERT_EQ(status.queued_tasks[0].description, "");

  auto events = collect_count(*channel, 3);
  ASSERT_EQ(events.size(), 3u);
  ASSERT_EQ(events[0].type, EventType::TaskRunning);
  ASSERT_EQ(events[1].type, EventType::TaskQueued);
  ASSERT_EQ(events[2].type, EventType::TaskDescriptionUpdate);
  const auto &data = std::get<TaskDescriptionData>(events[2].data);
  ASSERT_EQ(data.task_id, "run");
  ASSERT_EQ(data.description, "Loading data");
}

TEST_F(TaskQueueTest, JobReportsProgressThroughContext) {
  auto channel = queue_->subscribe_to_events();
  queue_->register_running_task(
      JobKind::ModelTraining, std::make_unique<LambdaJob>([](JobContext &ctx) {
        ctx.describe("Training epoch 1/2");
        ctx.describe("Training epoch 2/2");
        return Result<void, TaskError>::Ok();
      }),
      with_id("train"));

  auto events = collect_count(*channel, 4);
  ASSERT_EQ(count_of(events, EventType::TaskDescriptionUpdate, "train"), 2u);
  ASSERT_LT(index_of(events, EventType::TaskDescriptionUpdate, "train"),
            index_of(events, EventType::TaskCompleted, "train"));
}

// ============================================================
// Test: Completion
// ============================================================

TEST_F(TaskQueueTest, FailureIsReportedAsUnsuccessfulCompletion) {
  auto channel = queue_->subscribe_to_events();
  queue_->register_running_task(JobKind::Backtest, quick_job(), with_id("ok"));
  queue_->register_running_task(JobKind::Backtest, failing_job(),
                                with_id("err"));
  queue_->register_running_task(JobKind::Backtest, throwing_job(),
                                with_id("throw"));

  auto events = collect_until(*channel, [](const std::vector<Event> &evs) {
    return count_of(evs, EventType::TaskCompleted) >= 3;
  });

  for (const auto &event : events) {
    if (event.type != EventType::TaskCompleted) {
      continue;
    }
    const auto &done = std::get<TaskCompletedData>(event.data);
    ASSERT_EQ(done.success, done.task_id == "ok") << done.task_id;
  }
  ASSERT_EQ(count_of(events, EventType::TaskCompleted), 3u);
  ASSERT_TRUE(wait_until([&]() { return !queue_->has_active_tasks(); }));
}

TEST_F(TaskQueueTest, EveryTaskCompletesExactlyOnceInOrder) {
  auto channel = queue_->subscribe_to_events(0);
  std::vector<std::string> ids;
  for (int i = 0; i < 8; ++i) {
    ids.push_back("job-" + std::to_string(i));
    queue_->enqueue(i % 2 ? JobKind::Prediction : JobKind::Backtest,
                    i % 3 ? quick_job() : failing_job(), with_id(ids.back()));
  }
  while (queue_->try_execute_next().has_value()) {
  }
  ASSERT_TRUE(wait_until([&]() { return !queue_->has_active_tasks(); }));

  auto events = collect_until(*channel, [](const std::vector<Event> &evs) {
    return count_of(evs, EventType::TaskCompleted) >= 8;
  });
  for (const auto &id : ids) {
    ASSERT_EQ(count_of(events, EventType::TaskQueued, id), 1u) << id;
    ASSERT_EQ(count_of(events, EventType::TaskRunning, id), 1u) << id;
    ASSERT_EQ(count_of(events, EventType::TaskCompleted, id), 1u) << id;
    ASSERT_LT(index_of(events, EventType::TaskQueued, id),
              index_of(events, EventType::TaskRunning, id));
    ASSERT_LT(index_of(events, EventType::TaskRunning, id),
              index_of(events, EventType::TaskCompleted, id));
  }
}

// ============================================================
// Test: Subscribers
// ============================================================

TEST_F(TaskQueueTest, FullSubscriberDoesNotBlockOthers) {
  auto stalled = queue_->subscribe_to_events(1);
  auto live = queue_->subscribe_to_events();

  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(queue_
                    ->enqueue(JobKind::Prediction, quick_job(),
                              with_id("q" + std::to_string(i)))
                    .is_ok());
  }

  auto events = collect_count(*live, 5);
  ASSERT_EQ(events.size(), 5u);
  ASSERT_EQ(stalled->size(), 1u);
  ASSERT_EQ(stalled->dropped(), 4u);
}

TEST_F(TaskQueueTest, SaturatedSubscriberDoesNotDelayExecution) {
  auto stalled = queue_->subscribe_to_events(1);
  auto live = queue_->subscribe_to_events();

  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(queue_
                    ->register_running_task(JobKind::Prediction, quick_job(),
                                            with_id("r" + std::to_string(i)))
                    .is_ok());
  }
  for (int i = 0; i < 4; ++i) {
    const std::string id = "p" + std::to_string(i);
    ASSERT_TRUE(
        queue_->enqueue(JobKind::Prediction, quick_job(), with_id(id)).is_ok());
    ASSERT_EQ(queue_->try_execute_next(), id);
  }

  auto events = collect_until(*live, [](const std::vector<Event> &seen) {
    return count_of(seen, EventType::TaskCompleted) >= 8;
  });
  ASSERT_EQ(count_of(events, EventType::TaskCompleted), 8u);
  for (int i = 0; i < 4; ++i) {
    ASSERT_EQ(count_of(events, EventType::TaskCompleted,
                       "r" + std::to_string(i)),
              1u);
    ASSERT_EQ(count_of(events, EventType::TaskCompleted,
                       "p" + std::to_string(i)),
              1u);
  }
  ASSERT_TRUE(wait_until([this]() { return !queue_->has_active_tasks(); }));

  // The stalled channel kept its first event and lost the rest.
  ASSERT_EQ(stalled->size(), 1u);
  ASSERT_EQ(stalled->dropped() + 1, events.size());
}

TEST_F(TaskQueueTest, SubscriberDoesNotReceiveEarlierTransitions) {
  // Each broadcast samples the host, so a slow sampler widens the gap
  // between publishing and fan-out.
  sampler_->set_delay(std::chrono::milliseconds(100));
  ASSERT_TRUE(
      queue_->enqueue(JobKind::Backtest, quick_job(), with_id("before"))
          .is_ok());
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  auto channel = queue_->subscribe_to_events();
  ASSERT_TRUE(
      queue_->enqueue(JobKind::Backtest, quick_job(), with_id("after"))
          .is_ok());

  auto events = collect_until(*channel, [](const std::vector<Event> &seen) {
    return count_of(seen, EventType::TaskQueued, "after") == 1;
  });
  ASSERT_FALSE(channel->pop_for(std::chrono::milliseconds(50)).has_value());
  ASSERT_EQ(count_of(events, EventType::TaskQueued, "after"), 1u);
  ASSERT_EQ(count_of(events, EventType::TaskQueued, "before"), 0u);
  ASSERT_EQ(events.size(), 1u);
}

TEST_F(TaskQueueTest, UnsubscribedChannelReceivesNothing) {
  auto channel = queue_->subscribe_to_events();
  queue_->unsubscribe_from_events(channel);
  ASSERT_TRUE(channel->is_closed());

  queue_->enqueue(JobKind::Backtest, quick_job(), with_id("x"));
  ASSERT_FALSE(channel->pop_for(std::chrono::milliseconds(100)).has_value());

  // Second unsubscribe is harmless.
  queue_->unsubscribe_from_events(channel);
}

// ============================================================
// Test: Shutdown
// ============================================================

TEST_F(TaskQueueTest, ShutdownWaitsForRunningAndRefusesNewWork) {
  queue_->register_running_task(
      JobKind::Backtest, std::make_unique<LambdaJob>([](JobContext &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return Result<void, TaskError>::Ok();
      }),
      with_id("slow"));

  queue_->shutdown();
  ASSERT_EQ(queue_->get_queue_status().running_count, 0u);

  auto late = queue_->enqueue(JobKind::Backtest, quick_job());
  ASSERT_TRUE(late.is_err());
  ASSERT_EQ(late.error().category, ErrorCategory::Internal);
}
