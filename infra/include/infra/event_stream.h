#pragma once

#include "core/event.h"
#include "core/event_channel.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace tg::core {
class ILogger;
class TaskQueue;
} // namespace tg::core

namespace tg::infra {

/// Receives one SSE frame. Returning false means the client is gone.
using FrameSink = std::function<bool(const std::string &frame)>;

/// One client's live event stream.
///
/// run() subscribes, sends initial_state (queue status plus resources), then
/// forwards every broadcast event as an SSE frame. A poll that times out
/// sends a heartbeat with a fresh resource summary if `heartbeat_interval`
/// passed since the previous one.
/// The loop ends on stop() or when the sink reports a disconnect. The
/// subscription is always released.
class EventStreamSession {
public:
  EventStreamSession(tg::core::TaskQueue &queue, FrameSink sink,
                     std::shared_ptr<tg::core::ILogger> logger = nullptr,
                     std::chrono::milliseconds heartbeat_interval =
                         std::chrono::seconds(5),
                     std::chrono::milliseconds poll_interval =
                         std::chrono::seconds(1));

  EventStreamSession(const EventStreamSession &) = delete;
  EventStreamSession &operator=(const EventStreamSession &) = delete;

  /// Blocks until the stream ends. Returns the number of frames delivered.
  std::size_t run();

  /// Safe from any thread; run() notices within one poll interval.
  void stop() { stop_requested_.store(true); }

private:
  bool deliver(const tg::core::Event &event);
  tg::core::Event make_initial_state() const;
  tg::core::Event make_heartbeat() const;

  tg::core::TaskQueue &queue_;
  FrameSink sink_;
  std::shared_ptr<tg::core::ILogger> logger_;
  std::chrono::milliseconds heartbeat_interval_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> stop_requested_{false};
  std::size_t delivered_ = 0;
};

} // namespace tg::infra
