#pragma once

#include "core/result.h"
#include "core/task_error.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace tg::core {

/// Runs each admitted job on its own thread.
///
/// Admission already bounds how many jobs run at once, so there is no worker
/// cap here. Finished threads are joined lazily on the next launch() and
/// eagerly by join_all().
class JobExecutor {
public:
  JobExecutor() = default;
  ~JobExecutor();

  JobExecutor(const JobExecutor &) = delete;
  JobExecutor &operator=(const JobExecutor &) = delete;

  /// Err(Internal) if the OS refused to create a thread.
  Result<void, TaskError> launch(const std::string &task_id,
                                 std::function<void()> body);

  /// Blocks until every launched body returned. Must not be called from
  /// inside a body.
  void join_all();

  [[nodiscard]] std::size_t active() const;

private:
  struct Slot {
    std::string task_id;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reap_finished_locked();

  mutable std::mutex mutex_;
  std::list<Slot> slots_;
};

} // namespace tg::core
