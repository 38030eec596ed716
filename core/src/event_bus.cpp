#include "core/event_bus.h"

#include "core/logger.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace tg::core {

namespace {
constexpr const char *kComponent = "event_bus";
} // namespace

EventBus::EventBus(SnapshotProvider snapshot, std::shared_ptr<ILogger> logger,
                   std::size_t default_capacity)
    : snapshot_(std::move(snapshot)), logger_(std::move(logger)),
      default_capacity_(default_capacity) {
  dispatcher_ = std::thread([this]() { dispatch_loop(); });
}

EventBus::~EventBus() { shutdown(); }

void EventBus::publish(EventType type, EventData data) {
  Event event;
  event.type = type;
  event.timestamp = std::chrono::system_clock::now();
  event.data = std::move(data);
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (stopping_) {
      return;
    }
    pending_.push_back(Pending{next_seq_++, std::move(event)});
  }
  pending_cv_.notify_one();
}

std::shared_ptr<EventChannel> EventBus::subscribe(std::size_t capacity) {
  auto channel = std::make_shared<EventChannel>(capacity);
  std::size_t total = 0;
  {
    // Holding pending_mutex_ keeps next_seq_ and the dispatcher's target
    // snapshot consistent with this registration.
    std::lock_guard<std::mutex> pending_lock(pending_mutex_);
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.push_back(Subscriber{channel, next_seq_});
    total = subscribers_.size();
  }
  if (logger_) {
    logger_->info("-", kComponent, "subscriber_added",
                  "total " + std::to_string(total));
  }
  return channel;
}

void EventBus::unsubscribe(const std::shared_ptr<EventChannel> &channel) {
  if (!channel) {
    return;
  }
  bool removed = false;
  std::size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    auto it = std::find_if(
        subscribers_.begin(), subscribers_.end(),
        [&channel](const Subscriber &s) { return s.channel == channel; });
    if (it != subscribers_.end()) {
      subscribers_.erase(it);
      removed = true;
    }
    remaining = subscribers_.size();
  }
  channel->close();
  if (removed && logger_) {
    logger_->info("-", kComponent, "subscriber_removed",
                  "remaining " + std::to_string(remaining));
  }
}

std::size_t EventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  return subscribers_.size();
}

void EventBus::shutdown() {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    stopping_ = true;
  }
  pending_cv_.notify_all();
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
}

void EventBus::dispatch_loop() {
  while (true) {
    std::deque<Pending> batch;
    std::vector<Subscriber> targets;
    {
      std::unique_lock<std::mutex> lock(pending_mutex_);
      pending_cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
      if (pending_.empty()) {
        return; // stopping and fully drained
      }
      batch.swap(pending_);
      // Anyone subscribing later has first_seq beyond this whole batch.
      std::lock_guard<std::mutex> sub_lock(subscribers_mutex_);
      targets = subscribers_;
    }

    // One snapshot per drained batch: every event in it is stamped with a
    // reading taken after it was published.
    std::optional<ResourceSummary> resources;
    if (snapshot_) {
      try {
        resources = snapshot_();
      } catch (const std::exception &e) {
        if (logger_) {
          logger_->warn("-", kComponent, "snapshot_failed", e.what());
        }
      }
    }

    for (auto &item : batch) {
      Event &event = item.event;
      event.resources = resources;
      for (const auto &target : targets) {
        if (item.seq < target.first_seq) {
          continue; // published before this subscriber joined
        }
        const auto &channel = target.channel;
        if (!channel->try_push(event) && logger_ && !channel->is_closed()) {
          logger_->warn(event.task_id().empty() ? "-" : event.task_id(),
                        kComponent, "subscriber_full",
                        std::string("dropped ") + to_string(event.type) +
                            " for one subscriber");
        }
      }
    }
  }
}

} // namespace tg::core
