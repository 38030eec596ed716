#include "core/job_executor.h"

#include <system_error>
#include <utility>

namespace tg::core {

JobExecutor::~JobExecutor() { join_all(); }

Result<void, TaskError> JobExecutor::launch(const std::string &task_id,
                                            std::function<void()> body) {
  auto done = std::make_shared<std::atomic<bool>>(false);

  std::lock_guard<std::mutex> lock(mutex_);
  reap_finished_locked();

  Slot slot;
  slot.task_id = task_id;
  slot.done = done;
  try {
    slot.thread = std::thread([body = std::move(body), done]() {
      body();
      done->store(true, std::memory_order_release);
    });
  } catch (const std::system_error &e) {
    return Result<void, TaskError>::Err(TaskError(
        ErrorCategory::Internal, 4002, "Could not start job",
        std::string("thread creation failed: ") + e.what(),
        {{"task_id", task_id}}));
  }
  slots_.push_back(std::move(slot));
  return Result<void, TaskError>::Ok();
}

void JobExecutor::join_all() {
  std::list<Slot> slots;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    slots.swap(slots_);
  }
  for (auto &slot : slots) {
    if (slot.thread.joinable()) {
      slot.thread.join();
    }
  }
}

std::size_t JobExecutor::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &slot : slots_) {
    if (!slot.done->load(std::memory_order_acquire)) {
      ++count;
    }
  }
  return count;
}

void JobExecutor::reap_finished_locked() {
  for (auto it = slots_.begin(); it != slots_.end();) {
    if (it->done->load(std::memory_order_acquire)) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = slots_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace tg::core
