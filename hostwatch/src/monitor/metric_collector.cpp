#include "monitor/metric_collector.hpp"

#include <ctime>
#include <memory>

#include "fastlog/fastlog.hpp"
#include "monitor/connectivity_monitor.hpp"
#include "monitor/cpu_usage_monitor.hpp"
#include "monitor/disk_monitor.hpp"
#include "monitor/host_prober.hpp"
#include "monitor/memory_monitor.hpp"
#include "monitor/net_monitor.hpp"
#include "util/log_name.hpp"

namespace hostwatch {

MetricCollector::MetricCollector(std::vector<std::unique_ptr<Monitor>> monitors)
    : _monitors(std::move(monitors)) {}

MetricCollector::~MetricCollector() = default;

std::vector<std::unique_ptr<Monitor>> MetricCollector::make_default_monitors(
    const Config& config) {
  std::vector<std::unique_ptr<Monitor>> monitors;
  monitors.push_back(std::make_unique<CpuUsageMonitor>(config.sample_window));
  monitors.push_back(std::make_unique<DiskMonitor>(config.disk_path));
  monitors.push_back(std::make_unique<MemoryMonitor>());
  monitors.push_back(
      std::make_unique<NetMonitor>(config.interface, config.sample_window));
  monitors.push_back(std::make_unique<ConnectivityMonitor>(
      config.hosts, std::make_unique<PingProber>(config.probe_timeout)));
  return monitors;
}

int MetricCollector::collect_all(hostwatch::proto::SampleInfo* sample_info) {
  if (!sample_info) {
    return 0;
  }

  // 时间戳取周期开始时刻
  sample_info->set_timestamp(static_cast<int64_t>(::time(nullptr)));

  int failures = 0;
  for (auto& monitor : _monitors) {
    if (!monitor->update(sample_info)) {
      ++failures;
      monitor->apply_default(sample_info);
      auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
      if (log) log->warn("Monitor {} failed, using default value", monitor->name());
    }
  }
  return failures;
}

}  // namespace hostwatch
