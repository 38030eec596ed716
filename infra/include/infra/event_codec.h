#pragma once

#include "core/event.h"
#include "core/resource_monitor.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace tg::infra {

/// Local time, ISO-8601 with microseconds and no zone suffix,
/// e.g. "2025-11-18T20:28:26.123456".
std::string format_iso8601(std::chrono::system_clock::time_point tp);

/// {"cpu": {total_cores, available_cores, usage_percent, min_threshold_cores},
///  "ram": {total_gb, available_gb, usage_percent, min_threshold_gb},
///  "buffer_percent": 20.0}
/// Cores/GB rounded to 2 decimals, percentages to 1.
nlohmann::json to_json(const tg::core::ResourceSummary &summary);

/// {queued_count, running_count, queued_tasks: [...], running_tasks: [...]}
nlohmann::json to_json(const tg::core::QueueStatus &status);

/// Envelope: {type, timestamp, data, resources}. Heartbeats carry no "data";
/// "resources" is omitted when the event was never dispatched.
nlohmann::json to_json(const tg::core::Event &event);

/// Server-Sent Events frame: "data: <compact json>\n\n".
std::string encode_sse(const tg::core::Event &event);

} // namespace tg::infra
