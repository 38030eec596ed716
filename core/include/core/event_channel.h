#pragma once

#include "core/event.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace tg::core {

/// Per-subscriber event sink.
///
/// Producer side never blocks: try_push() fails when the channel is full or
/// closed and the event is dropped for this subscriber only. Consumer side
/// blocks in pop_for() with a timeout so it can interleave heartbeats.
class EventChannel {
public:
  /// capacity == 0 means unbounded.
  explicit EventChannel(std::size_t capacity);

  EventChannel(const EventChannel &) = delete;
  EventChannel &operator=(const EventChannel &) = delete;

  bool try_push(Event event);

  std::optional<Event> pop_for(std::chrono::milliseconds timeout);
  std::optional<Event> try_pop();

  /// Wakes blocked consumers; later pushes are rejected.
  void close();

  [[nodiscard]] bool is_closed() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] std::size_t dropped() const noexcept {
    return dropped_.load(std::memory_order_relaxed);
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Event> events_;
  bool closed_ = false;
  std::atomic<std::size_t> dropped_{0};
};

} // namespace tg::core
