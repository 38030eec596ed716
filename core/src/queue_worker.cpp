#include "core/queue_worker.h"

#include "core/logger.h"
#include "core/task_queue.h"

#include <exception>

namespace tg::core {

namespace {
constexpr const char *kComponent = "queue_worker";
} // namespace

QueueWorker::QueueWorker(TaskQueue &queue, std::chrono::milliseconds interval,
                         std::shared_ptr<ILogger> logger)
    : queue_(queue),
      interval_(interval.count() > 0 ? interval : kDefaultInterval),
      logger_(std::move(logger)) {}

QueueWorker::~QueueWorker() { stop(); }

bool QueueWorker::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (thread_.joinable()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_.store(true, std::memory_order_release);
  }
  thread_ = std::thread([this]() { run(); });

  if (logger_) {
    logger_->info("-", kComponent, "started",
                  "checking every " + std::to_string(interval_.count()) +
                      " ms");
  }
  return true;
}

void QueueWorker::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_.store(false, std::memory_order_release);
  }
  wake_cv_.notify_all();
  thread_.join();
  if (logger_) {
    logger_->info("-", kComponent, "stopped", "");
  }
}

std::optional<std::string> QueueWorker::tick() {
  try {
    const auto status = queue_.get_queue_status();
    if (status.queued_count > 0 && logger_) {
      logger_->debug("-", kComponent, "check",
                     std::to_string(status.queued_count) + " queued, " +
                         std::to_string(status.running_count) + " running");
    }

    auto task_id = queue_.try_execute_next();
    if (task_id.has_value()) {
      if (logger_) {
        logger_->info(*task_id, kComponent, "promoted", "started from queue");
      }
    } else if (status.queued_count > 0 && logger_) {
      logger_->debug("-", kComponent, "waiting",
                     "tasks queued but resources insufficient");
    }
    return task_id;
  } catch (const std::exception &e) {
    if (logger_) {
      logger_->error("-", kComponent, "tick_failed", e.what());
    }
  }
  return std::nullopt;
}

void QueueWorker::run() {
  std::unique_lock<std::mutex> lock(wake_mutex_);
  while (running_.load(std::memory_order_acquire)) {
    lock.unlock();
    tick();
    lock.lock();
    wake_cv_.wait_for(lock, interval_, [this]() {
      return !running_.load(std::memory_order_acquire);
    });
  }
}

} // namespace tg::core
