#include "core/event_channel.h"

#include <utility>

namespace tg::core {

EventChannel::EventChannel(std::size_t capacity) : capacity_(capacity) {}

bool EventChannel::try_push(Event event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || (capacity_ > 0 && events_.size() >= capacity_)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
  return true;
}

std::optional<Event> EventChannel::pop_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return closed_ || !events_.empty(); });
  if (events_.empty()) {
    return std::nullopt;
  }
  Event event = std::move(events_.front());
  events_.pop_front();
  return event;
}

std::optional<Event> EventChannel::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (events_.empty()) {
    return std::nullopt;
  }
  Event event = std::move(events_.front());
  events_.pop_front();
  return event;
}

void EventChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool EventChannel::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t EventChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

} // namespace tg::core
