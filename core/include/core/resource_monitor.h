#pragma once

#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tg::core {

class ILogger;

/// Raw host reading returned by a sampler.
struct HostSample {
  double cpu_percent = 0.0; // Busy percentage across all cores [0, 100]
  std::uint64_t ram_total_bytes = 0;
  std::uint64_t ram_available_bytes = 0;
};

/// OS-facing sampling seam. sample() may block (CPU usage is measured over a
/// short window), so callers must never invoke it while holding a queue lock.
class IResourceSampler {
public:
  virtual ~IResourceSampler() = default;

  /// Logical CPU count. Read once by ResourceMonitor at construction.
  [[nodiscard]] virtual int total_cpu_cores() const = 0;

  virtual Result<HostSample, TaskError> sample() = 0;
};

/// Admission tuning.
/// buffer_percent: fraction of total CPU/RAM that must stay free.
/// consumption_factor: fraction of a job's nominal footprint assumed consumed.
struct MonitorProfile {
  double buffer_percent = 0.20;
  double consumption_factor = 0.80;

  static MonitorProfile production() { return {0.20, 0.80}; }
  static MonitorProfile relaxed() { return {0.05, 0.50}; }
  static MonitorProfile for_mode(bool dev_mode) {
    return dev_mode ? relaxed() : production();
  }
};

/// Freshly sampled view of the host. Never cached across calls.
struct ResourceSnapshot {
  int total_cpu_cores = 0;
  double available_cpu_cores = 0.0;
  double total_ram_gb = 0.0;
  double available_ram_gb = 0.0;
  double cpu_percent = 0.0;
  double ram_percent = 0.0;
  bool sample_ok = true; // false: sampler failed, availability forced to zero
};

/// Outcome of the predictive check. `reason` always carries the numbers.
struct AdmissionDecision {
  bool admitted = false;
  std::string reason;
  double predicted_cpu_consumption = 0.0;
  double predicted_ram_consumption = 0.0;
  double predicted_cpu_available = 0.0;
  double predicted_ram_available = 0.0;
};

/// Snapshot plus the thresholds it is judged against.
struct ResourceSummary {
  ResourceSnapshot current;
  double min_cpu_cores = 0.0;
  double min_ram_gb = 0.0;
  double buffer_percent = 0.0; // As a percentage, e.g. 20.0
};

/// Samples host CPU/RAM and decides whether a job kind can start now without
/// pushing availability below the safety buffer.
///
/// The check is predictive: it does not look at what the queue is running,
/// it relies on OS-reported availability which already reflects load from
/// jobs started earlier. Thread-safe; holds no mutable state after
/// construction beyond the lazily captured RAM total.
class ResourceMonitor {
public:
  ResourceMonitor(MonitorProfile profile,
                  std::shared_ptr<IResourceSampler> sampler,
                  std::shared_ptr<ILogger> logger = nullptr);

  ResourceMonitor(const ResourceMonitor &) = delete;
  ResourceMonitor &operator=(const ResourceMonitor &) = delete;

  /// Best-effort: on sampler failure returns a snapshot with zero
  /// availability and sample_ok = false.
  [[nodiscard]] ResourceSnapshot get_current_resources() const;

  /// Admit iff predicted availability stays >= the minimum thresholds for
  /// both CPU and RAM. `consumption_factor` overrides the profile's factor.
  [[nodiscard]] AdmissionDecision
  can_run_task(JobKind kind,
               std::optional<double> consumption_factor = std::nullopt) const;

  [[nodiscard]] ResourceSummary get_resource_summary() const;

  [[nodiscard]] const MonitorProfile &profile() const noexcept {
    return profile_;
  }
  [[nodiscard]] int total_cpu_cores() const noexcept {
    return total_cpu_cores_;
  }
  [[nodiscard]] double total_ram_gb() const;
  [[nodiscard]] double min_cpu_cores() const noexcept { return min_cpu_cores_; }
  [[nodiscard]] double min_ram_gb() const;

private:
  void capture_ram_total(std::uint64_t total_bytes) const;

  MonitorProfile profile_;
  std::shared_ptr<IResourceSampler> sampler_;
  std::shared_ptr<ILogger> logger_;

  int total_cpu_cores_ = 0;
  double min_cpu_cores_ = 0.0;

  // RAM total is fixed once the first successful sample is seen.
  mutable std::mutex ram_mutex_;
  mutable bool ram_captured_ = false;
  mutable double total_ram_gb_ = 0.0;
  mutable double min_ram_gb_ = 0.0;
};

} // namespace tg::core
