#include "sink/record_format.hpp"

#include <cstdio>

#include "alert/threshold_evaluator.hpp"
#include "util/time_format.hpp"

namespace hostwatch {

std::string format_metrics_line(const hostwatch::proto::SampleInfo& sample) {
  const char* connectivity =
      sample.connectivity() == hostwatch::proto::CONNECTIVITY_OK ? "OK" : "FAIL";
  return format_timestamp(sample.timestamp()) +
         " | CPU: " + std::to_string(sample.cpu_usage_pct()) +
         "% | Disk: " + std::to_string(sample.disk_usage_pct()) +
         "% | Mem: " + std::to_string(sample.mem_usage_pct()) +
         "% | Net: " + std::to_string(sample.net_total_kbps()) +
         " KB/s | Connectivity: " + connectivity + "\n";
}

std::string format_alert_line(const hostwatch::proto::AlertInfo& alert) {
  return "[" + format_timestamp(alert.timestamp()) + "] " +
         alert_label(alert.kind()) + " ALERT: " + alert.message() + "\n";
}

std::string format_spike_block(const hostwatch::proto::CpuSpikeReport& report) {
  std::string block = "--- Top Processes during CPU spike at " +
                      format_timestamp(report.timestamp()) + " (Usage: " +
                      std::to_string(report.cpu_usage_pct()) + "%) ---\n";

  char row[256];
  std::snprintf(row, sizeof(row), "%-12s %8s %5s %5s %10s %s\n", "USER", "PID",
                "%CPU", "%MEM", "RSS", "COMMAND");
  block += row;
  for (const auto& process : report.processes()) {
    std::snprintf(row, sizeof(row), "%-12s %8d %5.1f %5.1f %10llu ",
                  process.user().c_str(), process.pid(), process.cpu_percent(),
                  process.mem_percent(),
                  static_cast<unsigned long long>(process.rss_kb()));
    block += row;
    block += process.command();
    block += "\n";
  }
  block += "--- End of list ---\n\n";
  return block;
}

std::string format_banner(int64_t unix_seconds) {
  return "--- Monitor started at " + format_banner_date(unix_seconds) + " ---\n";
}

}  // namespace hostwatch
