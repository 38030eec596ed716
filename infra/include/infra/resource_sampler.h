#pragma once

#include "core/resource_monitor.h"
#include "core/result.h"
#include "core/task_error.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace tg::infra {

/// Aggregate jiffies from the "cpu" line of /proc/stat.
struct CpuTimes {
  std::uint64_t idle = 0;  // idle + iowait
  std::uint64_t total = 0; // sum of all fields
};

/// Values of interest from /proc/meminfo, in bytes.
struct MemInfo {
  std::uint64_t total_bytes = 0;
  std::uint64_t available_bytes = 0;
};

/// Parses the first "cpu " line of /proc/stat content.
tg::core::Result<CpuTimes, tg::core::TaskError>
parse_proc_stat(const std::string &content);

/// Parses MemTotal and MemAvailable (kB) out of /proc/meminfo content.
tg::core::Result<MemInfo, tg::core::TaskError>
parse_meminfo(const std::string &content);

/// Busy percentage between two readings; 0 when no time elapsed.
double cpu_busy_percent(const CpuTimes &before, const CpuTimes &after);

/// Linux sampler: CPU busy % over `window` from two /proc/stat reads, RAM
/// from /proc/meminfo. sample() sleeps for `window`.
class ProcResourceSampler final : public tg::core::IResourceSampler {
public:
  explicit ProcResourceSampler(
      std::chrono::milliseconds window = std::chrono::milliseconds(100),
      std::string proc_root = "/proc");

  [[nodiscard]] int total_cpu_cores() const override;

  tg::core::Result<tg::core::HostSample, tg::core::TaskError> sample() override;

private:
  tg::core::Result<CpuTimes, tg::core::TaskError> read_cpu_times() const;
  tg::core::Result<MemInfo, tg::core::TaskError> read_meminfo() const;

  std::chrono::milliseconds window_;
  std::string proc_root_;
};

/// Sampler for the current platform.
std::shared_ptr<tg::core::IResourceSampler> create_host_sampler();

} // namespace tg::infra
