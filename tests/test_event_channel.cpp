#include <gtest/gtest.h>

#include "core/event_bus.h"
#include "core/event_channel.h"
#include "test_support.h"

#include <chrono>
#include <memory>
#include <thread>

using namespace tg::core;
using namespace tg::testing;

namespace {

Event queued_event(const std::string &id) {
  Event event;
  event.type = EventType::TaskQueued;
  TaskQueuedData data;
  data.task_id = id;
  event.data = data;
  return event;
}

} // namespace

// ============================================================
// Test: EventChannel
// ============================================================

TEST(EventChannel, BoundedChannelDropsWhenFull) {
  EventChannel channel(2);
  ASSERT_TRUE(channel.try_push(queued_event("a")));
  ASSERT_TRUE(channel.try_push(queued_event("b")));
  ASSERT_FALSE(channel.try_push(queued_event("c")));

  ASSERT_EQ(channel.size(), 2u);
  ASSERT_EQ(channel.dropped(), 1u);
  ASSERT_EQ(channel.try_pop()->task_id(), "a");
  ASSERT_EQ(channel.try_pop()->task_id(), "b");
  ASSERT_FALSE(channel.try_pop().has_value());
}

TEST(EventChannel, ZeroCapacityIsUnbounded) {
  EventChannel channel(0);
  for (int i = 0; i < 1000; ++i) {
    ASSERT_TRUE(channel.try_push(queued_event(std::to_string(i))));
  }
  ASSERT_EQ(channel.size(), 1000u);
  ASSERT_EQ(channel.dropped(), 0u);
}

TEST(EventChannel, PopForTimesOutWhenEmpty) {
  EventChannel channel(4);
  const auto begin = std::chrono::steady_clock::now();
  ASSERT_FALSE(channel.pop_for(std::chrono::milliseconds(30)).has_value());
  ASSERT_GE(std::chrono::steady_clock::now() - begin,
            std::chrono::milliseconds(25));
}

TEST(EventChannel, PopForWakesOnPush) {
  EventChannel channel(4);
  std::thread producer([&channel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.try_push(queued_event("late"));
  });

  auto event = channel.pop_for(std::chrono::seconds(5));
  producer.join();
  ASSERT_TRUE(event.has_value());
  ASSERT_EQ(event->task_id(), "late");
}

TEST(EventChannel, CloseRejectsPushesButKeepsBufferedEvents) {
  EventChannel channel(4);
  channel.try_push(queued_event("kept"));
  channel.close();

  ASSERT_TRUE(channel.is_closed());
  ASSERT_FALSE(channel.try_push(queued_event("late")));
  ASSERT_EQ(channel.pop_for(std::chrono::milliseconds(10))->task_id(), "kept");
  ASSERT_FALSE(channel.pop_for(std::chrono::seconds(5)).has_value());
}

// ============================================================
// Test: EventBus
// ============================================================

TEST(EventBus, StampsResourcesAndPreservesOrder) {
  int snapshots = 0;
  EventBus bus(
      [&snapshots]() {
        ++snapshots;
        ResourceSummary summary;
        summary.buffer_percent = 20.0;
        return summary;
      },
      nullptr, 16);
  auto channel = bus.subscribe();

  for (int i = 0; i < 5; ++i) {
    TaskQueuedData data;
    data.task_id = "e" + std::to_string(i);
    bus.publish(EventType::TaskQueued, data);
  }

  auto events = collect_count(*channel, 5);
  bus.shutdown();

  ASSERT_EQ(events.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    ASSERT_EQ(events[i].task_id(), "e" + std::to_string(i));
    ASSERT_TRUE(events[i].resources.has_value());
    ASSERT_DOUBLE_EQ(events[i].resources->buffer_percent, 20.0);
  }
  ASSERT_GE(snapshots, 1);
  ASSERT_LE(snapshots, 5);
}

TEST(EventBus, SnapshotFailureStillDelivers) {
  EventBus bus([]() -> ResourceSummary { throw std::runtime_error("no /proc"); },
               nullptr, 16);
  auto channel = bus.subscribe();
  bus.publish(EventType::Heartbeat, std::monostate{});

  auto event = channel->pop_for(std::chrono::seconds(5));
  ASSERT_TRUE(event.has_value());
  ASSERT_FALSE(event->resources.has_value());
}

TEST(EventBus, SubscribeUnsubscribeBookkeeping) {
  EventBus bus(nullptr, nullptr, 8);
  auto a = bus.subscribe();
  auto b = bus.subscribe(0);
  ASSERT_EQ(bus.subscriber_count(), 2u);
  ASSERT_EQ(a->capacity(), 8u);
  ASSERT_EQ(b->capacity(), 0u);

  bus.unsubscribe(a);
  ASSERT_EQ(bus.subscriber_count(), 1u);
  ASSERT_TRUE(a->is_closed());

  bus.unsubscribe(a);
  bus.unsubscribe(nullptr);
  ASSERT_EQ(bus.subscriber_count(), 1u);
}

TEST(EventBus, ShutdownDeliversBacklog) {
  EventBus bus(nullptr, nullptr, 0);
  auto channel = bus.subscribe();
  for (int i = 0; i < 50; ++i) {
    bus.publish(EventType::Heartbeat, std::monostate{});
  }
  bus.shutdown();
  ASSERT_EQ(channel->size(), 50u);

  bus.publish(EventType::Heartbeat, std::monostate{});
  ASSERT_EQ(channel->size(), 50u);
}

TEST(EventBus, LateSubscriberSeesOnlyLaterEvents) {
  // A slow snapshot keeps the dispatcher busy between draining a batch and
  // fanning it out.
  EventBus bus(
      []() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return ResourceSummary{};
      },
      nullptr, 0);
  auto early = bus.subscribe();

  TaskQueuedData first;
  first.task_id = "in-flight";
  bus.publish(EventType::TaskQueued, first);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  TaskQueuedData second;
  second.task_id = "still-pending";
  bus.publish(EventType::TaskQueued, second);

  auto late = bus.subscribe();
  TaskQueuedData third;
  third.task_id = "after-subscribe";
  bus.publish(EventType::TaskQueued, third);

  auto early_events = collect_count(*early, 3);
  auto late_events = collect_count(*late, 1);
  // Anything else for the late channel would have arrived with the events
  // the early channel already holds.
  ASSERT_FALSE(late->pop_for(std::chrono::milliseconds(50)).has_value());
  bus.shutdown();

  ASSERT_EQ(early_events.size(), 3u);
  ASSERT_EQ(early_events[0].task_id(), "in-flight");
  ASSERT_EQ(early_events[2].task_id(), "after-subscribe");
  ASSERT_EQ(late_events.size(), 1u);
  ASSERT_EQ(late_events[0].task_id(), "after-subscribe");
}
