#include "alert/threshold_evaluator.hpp"

#include <algorithm>

#include "fastlog/fastlog.hpp"
#include "util/log_name.hpp"

namespace hostwatch {

namespace {

hostwatch::proto::AlertInfo make_alert(int64_t timestamp,
                                       hostwatch::proto::AlertKind kind,
                                       const std::string& message) {
  hostwatch::proto::AlertInfo alert;
  alert.set_timestamp(timestamp);
  alert.set_kind(kind);
  alert.set_message(message);
  alert.set_severity(hostwatch::proto::SEVERITY_BREACH);
  return alert;
}

std::string percent_message(int64_t value, int64_t threshold) {
  return "Usage is " + std::to_string(value) + "%, exceeding threshold of " +
         std::to_string(threshold) + "%.";
}

}  // namespace

std::string alert_label(hostwatch::proto::AlertKind kind) {
  switch (kind) {
    case hostwatch::proto::ALERT_KIND_CPU:
      return "CPU";
    case hostwatch::proto::ALERT_KIND_DISK:
      return "DISK";
    case hostwatch::proto::ALERT_KIND_MEM:
      return "MEMORY";
    case hostwatch::proto::ALERT_KIND_NET:
      return "NETWORK";
    case hostwatch::proto::ALERT_KIND_CONNECTIVITY:
      return "CONNECTIVITY";
    default:
      return "UNKNOWN";
  }
}

std::vector<hostwatch::proto::AlertInfo> connectivity_alerts(
    const hostwatch::proto::SampleInfo& sample) {
  std::vector<hostwatch::proto::AlertInfo> alerts;
  for (const auto& probe : sample.host_probes()) {
    if (probe.reachable()) {
      continue;
    }
    auto alert = make_alert(sample.timestamp(),
                            hostwatch::proto::ALERT_KIND_CONNECTIVITY,
                            "Host " + probe.host() + " is unreachable.");
    alert.set_host(probe.host());
    alerts.push_back(std::move(alert));
  }
  return alerts;
}

ThresholdEvaluator::ThresholdEvaluator(const Config& config,
                                       ProcessSource* process_source)
    : _config(config), _process_source(process_source) {}

std::vector<hostwatch::proto::AlertInfo> ThresholdEvaluator::evaluate(
    const hostwatch::proto::SampleInfo& sample) const {
  std::vector<hostwatch::proto::AlertInfo> alerts;
  int64_t ts = sample.timestamp();

  if (sample.cpu_usage_pct() > _config.cpu_threshold) {
    alerts.push_back(make_alert(
        ts, hostwatch::proto::ALERT_KIND_CPU,
        percent_message(sample.cpu_usage_pct(), _config.cpu_threshold)));
  }
  if (sample.disk_usage_pct() > _config.disk_threshold) {
    alerts.push_back(make_alert(
        ts, hostwatch::proto::ALERT_KIND_DISK,
        percent_message(sample.disk_usage_pct(), _config.disk_threshold)));
  }
  if (sample.mem_usage_pct() > _config.mem_threshold) {
    alerts.push_back(make_alert(
        ts, hostwatch::proto::ALERT_KIND_MEM,
        percent_message(sample.mem_usage_pct(), _config.mem_threshold)));
  }
  if (sample.net_total_kbps() > _config.net_threshold) {
    alerts.push_back(make_alert(
        ts, hostwatch::proto::ALERT_KIND_NET,
        "Usage is " + std::to_string(sample.net_total_kbps()) +
            " KB/s, exceeding threshold of " +
            std::to_string(_config.net_threshold) + " KB/s."));
  }
  return alerts;
}

bool ThresholdEvaluator::capture_cpu_spike(
    const hostwatch::proto::SampleInfo& sample,
    const std::vector<hostwatch::proto::AlertInfo>& alerts,
    hostwatch::proto::CpuSpikeReport* report) const {
  bool cpu_alert = std::any_of(
      alerts.begin(), alerts.end(), [](const hostwatch::proto::AlertInfo& a) {
        return a.kind() == hostwatch::proto::ALERT_KIND_CPU;
      });
  if (!cpu_alert) {
    return false;
  }

  report->Clear();
  report->set_timestamp(sample.timestamp());
  report->set_cpu_usage_pct(sample.cpu_usage_pct());
  if (_process_source) {
    for (auto& process : _process_source->top_by_cpu(kTopProcessCount)) {
      *report->add_processes() = std::move(process);
    }
  }
  if (report->processes_size() == 0) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->warn("CPU spike at {}% but no process snapshot available",
                       sample.cpu_usage_pct());
  }
  return true;
}

}  // namespace hostwatch
