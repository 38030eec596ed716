#include "infra/event_codec.h"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace tg::infra {

using nlohmann::json;

namespace {

double round_to(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

json task_fields(const std::string &task_id, tg::core::JobKind kind) {
  return json{{"task_id", task_id}, {"task_type", tg::core::to_string(kind)}};
}

struct DataEncoder {
  json operator()(const std::monostate &) const { return nullptr; }

  json operator()(const tg::core::TaskQueuedData &d) const {
    json j = task_fields(d.task_id, d.kind);
    j["estimated_cpu_cores"] = d.estimated_cpu_cores;
    j["estimated_ram_gb"] = d.estimated_ram_gb;
    j["queue_position"] = d.queue_position;
    j["description"] = d.description;
    return j;
  }

  json operator()(const tg::core::TaskRunningData &d) const {
    json j = task_fields(d.task_id, d.kind);
    j["estimated_cpu_cores"] = d.estimated_cpu_cores;
    j["estimated_ram_gb"] = d.estimated_ram_gb;
    return j;
  }

  json operator()(const tg::core::TaskCompletedData &d) const {
    json j = task_fields(d.task_id, d.kind);
    j["success"] = d.success;
    return j;
  }

  json operator()(const tg::core::TaskDescriptionData &d) const {
    json j = task_fields(d.task_id, d.kind);
    j["description"] = d.description;
    return j;
  }

  json operator()(const tg::core::QueueStatus &status) const {
    return to_json(status);
  }
};

} // namespace

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&seconds, &local);

  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          tp.time_since_epoch())
                          .count() %
                      1000000;

  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(6) << (micros < 0 ? micros + 1000000 : micros);
  return oss.str();
}

json to_json(const tg::core::ResourceSummary &summary) {
  const auto &now = summary.current;
  return json{
      {"cpu",
       {{"total_cores", now.total_cpu_cores},
        {"available_cores", round_to(now.available_cpu_cores, 2)},
        {"usage_percent", round_to(now.cpu_percent, 1)},
        {"min_threshold_cores", round_to(summary.min_cpu_cores, 2)}}},
      {"ram",
       {{"total_gb", round_to(now.total_ram_gb, 2)},
        {"available_gb", round_to(now.available_ram_gb, 2)},
        {"usage_percent", round_to(now.ram_percent, 1)},
        {"min_threshold_gb", round_to(summary.min_ram_gb, 2)}}},
      {"buffer_percent", summary.buffer_percent},
  };
}

json to_json(const tg::core::QueueStatus &status) {
  json queued = json::array();
  for (const auto &task : status.queued_tasks) {
    json j = task_fields(task.task_id, task.kind);
    j["priority"] = task.priority;
    j["queued_at"] = format_iso8601(task.queued_at);
    j["estimated_cpu_cores"] = task.estimated_cpu_cores;
    j["estimated_ram_gb"] = task.estimated_ram_gb;
    j["queue_position"] = task.queue_position;
    j["description"] = task.description;
    if (!task.owner.empty()) {
      j["owner"] = task.owner;
    }
    queued.push_back(std::move(j));
  }

  json running = json::array();
  for (const auto &task : status.running_tasks) {
    json j = task_fields(task.task_id, task.kind);
    j["estimated_cpu_cores"] = task.estimated_cpu_cores;
    j["estimated_ram_gb"] = task.estimated_ram_gb;
    j["description"] = task.description;
    if (!task.owner.empty()) {
      j["owner"] = task.owner;
    }
    running.push_back(std::move(j));
  }

  return json{
      {"queued_count", status.queued_count},
      {"running_count", status.running_count},
      {"queued_tasks", std::move(queued)},
      {"running_tasks", std::move(running)},
  };
}

json to_json(const tg::core::Event &event) {
  json j;
  j["type"] = tg::core::to_string(event.type);
  j["timestamp"] = format_iso8601(event.timestamp);
  if (!std::holds_alternative<std::monostate>(event.data)) {
    j["data"] = std::visit(DataEncoder{}, event.data);
  }
  if (event.resources.has_value()) {
    j["resources"] = to_json(*event.resources);
  }
  return j;
}

std::string encode_sse(const tg::core::Event &event) {
  return "data: " + to_json(event).dump() + "\n\n";
}

} // namespace tg::infra
