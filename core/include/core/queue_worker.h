#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tg::core {

class ILogger;
class TaskQueue;

/// Periodic promotion driver.
///
/// Every `interval` it calls TaskQueue::try_execute_next() exactly once, so
/// at most one task is promoted per tick. Promotion latency is therefore up
/// to one interval; there is no resource-change notification.
class QueueWorker {
public:
  static constexpr std::chrono::milliseconds kDefaultInterval{5000};

  explicit QueueWorker(TaskQueue &queue,
                       std::chrono::milliseconds interval = kDefaultInterval,
                       std::shared_ptr<ILogger> logger = nullptr);
  ~QueueWorker();

  QueueWorker(const QueueWorker &) = delete;
  QueueWorker &operator=(const QueueWorker &) = delete;

  /// Returns false if already running.
  bool start();

  /// Wakes the loop and joins it. Idempotent and safe to call from several
  /// threads at once; start() may be called again afterwards.
  void stop();

  [[nodiscard]] bool is_running() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] std::chrono::milliseconds interval() const noexcept {
    return interval_;
  }

  /// One loop iteration. Returns the promoted task id, if any.
  std::optional<std::string> tick();

private:
  void run();

  TaskQueue &queue_;
  const std::chrono::milliseconds interval_;
  std::shared_ptr<ILogger> logger_;

  // Serializes start() and stop(), including the join. run() never takes it.
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread thread_;
};

} // namespace tg::core
