#include "infra/resource_sampler.h"

#include <unistd.h>

#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

namespace tg::infra {

using tg::core::HostSample;
using tg::core::Result;
using tg::core::TaskError;

namespace {

Result<std::string, TaskError> read_file(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return Result<std::string, TaskError>::Err(
        TaskError(tg::core::ErrorCategory::Resource, 2002,
                  "Host resources unavailable", "cannot open " + path,
                  {{"path", path}}));
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return Result<std::string, TaskError>::Ok(oss.str());
}

} // namespace

Result<CpuTimes, TaskError> parse_proc_stat(const std::string &content) {
  std::istringstream lines(content);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.rfind("cpu ", 0) != 0) {
      continue;
    }
    std::istringstream fields(line.substr(4));
    std::vector<std::uint64_t> values;
    std::uint64_t value = 0;
    while (fields >> value) {
      values.push_back(value);
    }
    // user nice system idle [iowait irq softirq steal ...]
    if (values.size() < 4) {
      break;
    }
    CpuTimes times;
    times.idle = values[3] + (values.size() > 4 ? values[4] : 0);
    for (auto v : values) {
      times.total += v;
    }
    return Result<CpuTimes, TaskError>::Ok(times);
  }
  return Result<CpuTimes, TaskError>::Err(
      TaskError::Resource("malformed /proc/stat: no aggregate cpu line"));
}

Result<MemInfo, TaskError> parse_meminfo(const std::string &content) {
  std::istringstream lines(content);
  std::string line;
  MemInfo info;
  bool has_total = false;
  bool has_available = false;
  while (std::getline(lines, line)) {
    std::istringstream fields(line);
    std::string key;
    std::uint64_t kb = 0;
    if (!(fields >> key >> kb)) {
      continue;
    }
    if (key == "MemTotal:") {
      info.total_bytes = kb * 1024;
      has_total = true;
    } else if (key == "MemAvailable:") {
      info.available_bytes = kb * 1024;
      has_available = true;
    }
  }
  if (!has_total || !has_available) {
    return Result<MemInfo, TaskError>::Err(TaskError::Resource(
        "malformed /proc/meminfo: MemTotal or MemAvailable missing"));
  }
  return Result<MemInfo, TaskError>::Ok(info);
}

double cpu_busy_percent(const CpuTimes &before, const CpuTimes &after) {
  if (after.total <= before.total) {
    return 0.0;
  }
  const double total = static_cast<double>(after.total - before.total);
  const double idle = after.idle >= before.idle
                          ? static_cast<double>(after.idle - before.idle)
                          : 0.0;
  const double busy = (total - idle) / total * 100.0;
  return busy < 0.0 ? 0.0 : (busy > 100.0 ? 100.0 : busy);
}

ProcResourceSampler::ProcResourceSampler(std::chrono::milliseconds window,
                                         std::string proc_root)
    : window_(window), proc_root_(std::move(proc_root)) {}

int ProcResourceSampler::total_cpu_cores() const {
  const long online = sysconf(_SC_NPROCESSORS_ONLN);
  if (online > 0) {
    return static_cast<int>(online);
  }
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<int>(hw) : 1;
}

Result<CpuTimes, TaskError> ProcResourceSampler::read_cpu_times() const {
  auto content = read_file(proc_root_ + "/stat");
  if (content.is_err()) {
    return Result<CpuTimes, TaskError>::Err(content.error());
  }
  return parse_proc_stat(content.value());
}

Result<MemInfo, TaskError> ProcResourceSampler::read_meminfo() const {
  auto content = read_file(proc_root_ + "/meminfo");
  if (content.is_err()) {
    return Result<MemInfo, TaskError>::Err(content.error());
  }
  return parse_meminfo(content.value());
}

Result<HostSample, TaskError> ProcResourceSampler::sample() {
  auto before = read_cpu_times();
  if (before.is_err()) {
    return Result<HostSample, TaskError>::Err(before.error());
  }
  std::this_thread::sleep_for(window_);
  auto after = read_cpu_times();
  if (after.is_err()) {
    return Result<HostSample, TaskError>::Err(after.error());
  }
  auto mem = read_meminfo();
  if (mem.is_err()) {
    return Result<HostSample, TaskError>::Err(mem.error());
  }

  HostSample sample;
  sample.cpu_percent = cpu_busy_percent(before.value(), after.value());
  sample.ram_total_bytes = mem.value().total_bytes;
  sample.ram_available_bytes = mem.value().available_bytes;
  return Result<HostSample, TaskError>::Ok(sample);
}

std::shared_ptr<tg::core::IResourceSampler> create_host_sampler() {
  return std::make_shared<ProcResourceSampler>();
}

} // namespace tg::infra
