#pragma once

#include "core/event.h"
#include "core/event_channel.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace tg::core {

class ILogger;

/// Publish/subscribe fan-out for scheduler events.
///
/// publish() only appends to an internal FIFO and returns; a dedicated
/// dispatcher thread takes a resource snapshot (which may block on the OS)
/// and offers each event to every subscriber channel with try_push().
/// A full channel loses that event; other subscribers are unaffected.
/// A subscriber only receives events published after subscribe() returned.
class EventBus {
public:
  using SnapshotProvider = std::function<ResourceSummary()>;

  EventBus(SnapshotProvider snapshot, std::shared_ptr<ILogger> logger,
           std::size_t default_capacity);
  ~EventBus();

  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  void publish(EventType type, EventData data);

  std::shared_ptr<EventChannel> subscribe(std::size_t capacity);
  std::shared_ptr<EventChannel> subscribe() {
    return subscribe(default_capacity_);
  }

  /// Closes the channel. Unknown channels are ignored.
  void unsubscribe(const std::shared_ptr<EventChannel> &channel);

  [[nodiscard]] std::size_t subscriber_count() const;

  /// Delivers everything already published, then joins the dispatcher.
  void shutdown();

private:
  struct Pending {
    std::uint64_t seq = 0;
    Event event;
  };

  struct Subscriber {
    std::shared_ptr<EventChannel> channel;
    std::uint64_t first_seq = 0; // First sequence number it may see
  };

  void dispatch_loop();

  SnapshotProvider snapshot_;
  std::shared_ptr<ILogger> logger_;
  const std::size_t default_capacity_;

  std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  std::deque<Pending> pending_;
  std::uint64_t next_seq_ = 0;
  bool stopping_ = false;

  // Lock order: pending_mutex_ before subscribers_mutex_.
  mutable std::mutex subscribers_mutex_;
  std::vector<Subscriber> subscribers_;

  std::thread dispatcher_;
};

} // namespace tg::core
