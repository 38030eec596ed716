#include "core/event.h"

#include <type_traits>
#include <variant>

namespace tg::core {

const char *to_string(EventType type) {
  switch (type) {
  case EventType::TaskQueued:
    return "task_queued";
  case EventType::TaskRunning:
    return "task_running";
  case EventType::TaskCompleted:
    return "task_completed";
  case EventType::TaskDescriptionUpdate:
    return "task_description_update";
  case EventType::Heartbeat:
    return "heartbeat";
  case EventType::InitialState:
    return "initial_state";
  }
  return "unknown";
}

std::string Event::task_id() const {
  return std::visit(
      [](const auto &payload) -> std::string {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, std::monostate> ||
                      std::is_same_v<T, QueueStatus>) {
          return {};
        } else {
          return payload.task_id;
        }
      },
      data);
}

} // namespace tg::core
