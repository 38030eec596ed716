#include "infra/event_stream.h"

#include "core/logger.h"
#include "core/task_queue.h"
#include "infra/event_codec.h"

namespace tg::infra {

using tg::core::Event;
using tg::core::EventType;

namespace {

// Releases the subscription on every exit path of run().
class SubscriptionGuard {
public:
  SubscriptionGuard(tg::core::TaskQueue &queue,
                    std::shared_ptr<tg::core::EventChannel> channel)
      : queue_(queue), channel_(std::move(channel)) {}
  ~SubscriptionGuard() { queue_.unsubscribe_from_events(channel_); }

  SubscriptionGuard(const SubscriptionGuard &) = delete;
  SubscriptionGuard &operator=(const SubscriptionGuard &) = delete;

private:
  tg::core::TaskQueue &queue_;
  std::shared_ptr<tg::core::EventChannel> channel_;
};

} // namespace

EventStreamSession::EventStreamSession(
    tg::core::TaskQueue &queue, FrameSink sink,
    std::shared_ptr<tg::core::ILogger> logger,
    std::chrono::milliseconds heartbeat_interval,
    std::chrono::milliseconds poll_interval)
    : queue_(queue), sink_(std::move(sink)), logger_(std::move(logger)),
      heartbeat_interval_(heartbeat_interval), poll_interval_(poll_interval) {}

bool EventStreamSession::deliver(const Event &event) {
  if (!sink_(encode_sse(event))) {
    if (logger_) {
      const std::string task_id = event.task_id();
      logger_->info(task_id.empty() ? "-" : task_id, "event_stream",
                    "client_disconnected",
                    "Sink closed while sending " +
                        std::string(tg::core::to_string(event.type)));
    }
    return false;
  }
  ++delivered_;
  return true;
}

Event EventStreamSession::make_initial_state() const {
  Event event;
  event.type = EventType::InitialState;
  event.data = queue_.get_queue_status();
  event.resources = queue_.monitor().get_resource_summary();
  return event;
}

Event EventStreamSession::make_heartbeat() const {
  Event event;
  event.type = EventType::Heartbeat;
  event.resources = queue_.monitor().get_resource_summary();
  return event;
}

std::size_t EventStreamSession::run() {
  // Subscribe before the snapshot so no transition falls between the two.
  auto channel = queue_.subscribe_to_events();
  SubscriptionGuard guard(queue_, channel);

  if (logger_) {
    logger_->info("-", "event_stream", "session_started",
                  "Streaming queue events");
  }

  if (!deliver(make_initial_state())) {
    return delivered_;
  }

  // Heartbeats go out on idle polls only, at most once per interval.
  auto last_heartbeat = std::chrono::steady_clock::now();
  while (!stop_requested_.load()) {
    auto event = channel->pop_for(poll_interval_);
    if (event) {
      if (!deliver(*event)) {
        break;
      }
      continue;
    }
    if (channel->is_closed()) {
      break;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now - last_heartbeat >= heartbeat_interval_) {
      if (!deliver(make_heartbeat())) {
        break;
      }
      last_heartbeat = now;
    }
  }

  if (logger_) {
    logger_->info("-", "event_stream", "session_ended",
                  "Frames delivered: " + std::to_string(delivered_) +
                      ", dropped: " + std::to_string(channel->dropped()));
  }
  return delivered_;
}

} // namespace tg::infra
