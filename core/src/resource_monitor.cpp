#include "core/resource_monitor.h"

#include "core/logger.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tg::core {

namespace {

constexpr double kBytesPerGb = 1024.0 * 1024.0 * 1024.0;
constexpr const char *kComponent = "resource_monitor";

std::string fixed2(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value;
  return oss.str();
}

} // namespace

ResourceMonitor::ResourceMonitor(MonitorProfile profile,
                                 std::shared_ptr<IResourceSampler> sampler,
                                 std::shared_ptr<ILogger> logger)
    : profile_(profile), sampler_(std::move(sampler)),
      logger_(std::move(logger)) {
  if (sampler_) {
    total_cpu_cores_ = std::max(0, sampler_->total_cpu_cores());
  }
  min_cpu_cores_ = total_cpu_cores_ * profile_.buffer_percent;

  if (sampler_) {
    auto initial = sampler_->sample();
    if (initial.is_ok()) {
      capture_ram_total(initial.value().ram_total_bytes);
    } else if (logger_) {
      logger_->warn("-", kComponent, "initial_sample_failed",
                    initial.error().internal_message);
    }
  }

  if (logger_) {
    logger_->info("-", kComponent, "configured",
                  "total " + std::to_string(total_cpu_cores_) + " cores, " +
                      fixed2(total_ram_gb()) + " GB RAM; min thresholds " +
                      fixed2(min_cpu_cores_) + " cores, " +
                      fixed2(min_ram_gb()) + " GB; buffer " +
                      fixed2(profile_.buffer_percent * 100.0) +
                      "%, consumption factor " +
                      fixed2(profile_.consumption_factor * 100.0) + "%");
  }
}

void ResourceMonitor::capture_ram_total(std::uint64_t total_bytes) const {
  std::lock_guard<std::mutex> lock(ram_mutex_);
  if (ram_captured_ || total_bytes == 0) {
    return;
  }
  ram_captured_ = true;
  total_ram_gb_ = static_cast<double>(total_bytes) / kBytesPerGb;
  min_ram_gb_ = total_ram_gb_ * profile_.buffer_percent;
}

double ResourceMonitor::total_ram_gb() const {
  std::lock_guard<std::mutex> lock(ram_mutex_);
  return total_ram_gb_;
}

double ResourceMonitor::min_ram_gb() const {
  std::lock_guard<std::mutex> lock(ram_mutex_);
  return min_ram_gb_;
}

ResourceSnapshot ResourceMonitor::get_current_resources() const {
  ResourceSnapshot snap;
  snap.total_cpu_cores = total_cpu_cores_;

  if (!sampler_) {
    snap.sample_ok = false;
    snap.total_ram_gb = total_ram_gb();
    snap.cpu_percent = 100.0;
    snap.ram_percent = 100.0;
    return snap;
  }

  auto sampled = sampler_->sample();
  if (sampled.is_err()) {
    if (logger_) {
      logger_->warn("-", kComponent, "sample_failed",
                    sampled.error().internal_message);
    }
    // Fail-safe: nothing is reported free, so every admission is refused.
    snap.sample_ok = false;
    snap.total_ram_gb = total_ram_gb();
    snap.cpu_percent = 100.0;
    snap.ram_percent = 100.0;
    return snap;
  }

  const HostSample &host = sampled.value();
  capture_ram_total(host.ram_total_bytes);

  const double cpu_percent = std::clamp(host.cpu_percent, 0.0, 100.0);
  snap.cpu_percent = cpu_percent;
  snap.available_cpu_cores = total_cpu_cores_ * (1.0 - cpu_percent / 100.0);

  snap.total_ram_gb = total_ram_gb();
  snap.available_ram_gb =
      static_cast<double>(host.ram_available_bytes) / kBytesPerGb;
  if (host.ram_total_bytes > 0) {
    const double used = static_cast<double>(host.ram_total_bytes) -
                        static_cast<double>(host.ram_available_bytes);
    snap.ram_percent = std::clamp(
        used / static_cast<double>(host.ram_total_bytes) * 100.0, 0.0, 100.0);
  }
  return snap;
}

AdmissionDecision
ResourceMonitor::can_run_task(JobKind kind,
                              std::optional<double> consumption_factor) const {
  const double factor = consumption_factor.value_or(profile_.consumption_factor);
  const ResourceSnapshot current = get_current_resources();
  const ResourceRequirement &req = requirement_for(kind);

  AdmissionDecision decision;
  decision.predicted_cpu_consumption = req.cpu_cores * factor;
  decision.predicted_ram_consumption = req.ram_gb * factor;
  decision.predicted_cpu_available =
      current.available_cpu_cores - decision.predicted_cpu_consumption;
  decision.predicted_ram_available =
      current.available_ram_gb - decision.predicted_ram_consumption;

  const double min_cpu = min_cpu_cores_;
  const double min_ram = min_ram_gb();

  if (logger_) {
    logger_->debug("-", kComponent, "check",
                   std::string(to_string(kind)) + ": available " +
                       fixed2(current.available_cpu_cores) + " cores, " +
                       fixed2(current.available_ram_gb) + " GB; requires " +
                       fixed2(req.cpu_cores) + " cores, " +
                       fixed2(req.ram_gb) + " GB; predicted (" +
                       fixed2(factor * 100.0) + "%) " +
                       fixed2(decision.predicted_cpu_consumption) + " cores, " +
                       fixed2(decision.predicted_ram_consumption) + " GB");
  }

  if (!current.sample_ok) {
    decision.admitted = false;
    decision.reason = "Resource sampling failed: host availability unknown";
  } else if (decision.predicted_cpu_available < min_cpu) {
    decision.admitted = false;
    decision.reason = "Insufficient CPU: need " +
                      fixed2(decision.predicted_cpu_consumption) +
                      ", available " + fixed2(current.available_cpu_cores) +
                      ", would leave " +
                      fixed2(decision.predicted_cpu_available) + " (min: " +
                      fixed2(min_cpu) + ")";
  } else if (decision.predicted_ram_available < min_ram) {
    decision.admitted = false;
    decision.reason = "Insufficient RAM: need " +
                      fixed2(decision.predicted_ram_consumption) +
                      "GB, available " + fixed2(current.available_ram_gb) +
                      "GB, would leave " +
                      fixed2(decision.predicted_ram_available) + "GB (min: " +
                      fixed2(min_ram) + "GB)";
  } else {
    decision.admitted = true;
    decision.reason = "Can run: " + fixed2(decision.predicted_cpu_available) +
                      " cores and " + fixed2(decision.predicted_ram_available) +
                      "GB RAM will remain";
  }

  if (logger_) {
    logger_->debug("-", kComponent,
                   decision.admitted ? "approved" : "blocked", decision.reason);
  }
  return decision;
}

ResourceSummary ResourceMonitor::get_resource_summary() const {
  ResourceSummary summary;
  summary.current = get_current_resources();
  summary.min_cpu_cores = min_cpu_cores_;
  summary.min_ram_gb = min_ram_gb();
  summary.buffer_percent = profile_.buffer_percent * 100.0;
  return summary;
}

} // namespace tg::core
