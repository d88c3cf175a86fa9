#include "monitor/cpu_usage_monitor.hpp"

#include <algorithm>
#include <thread>
#include <vector>

#include "fastlog/fastlog.hpp"
#include "util/log_name.hpp"
#include "util/readfile.hpp"

namespace hostwatch {

CpuUsageMonitor::CpuUsageMonitor(std::chrono::milliseconds window,
                                 std::string stat_path)
    : _window(window), _stat_path(std::move(stat_path)) {}

bool CpuUsageMonitor::read_cpu_stat(const std::string& stat_path,
                                    CpuStat* stat) {
  ReadFile stat_file(stat_path);
  if (!stat_file.is_open()) {
    return false;
  }
  std::vector<std::string> fields;
  while (stat_file.read_line(&fields)) {
    // 只取聚合行 "cpu  user nice system idle iowait irq softirq steal ..."
    if (fields.empty() || fields[0] != "cpu") {
      continue;
    }
    if (fields.size() < 5) {
      return false;
    }
    uint64_t values[8] = {0};
    try {
      for (size_t i = 1; i < fields.size() && i <= 8; ++i) {
        values[i - 1] = std::stoull(fields[i]);
      }
    } catch (const std::exception&) {
      return false;
    }
    stat->user = values[0];
    stat->nice = values[1];
    stat->system = values[2];
    stat->idle = values[3];
    stat->io_wait = values[4];
    stat->irq = values[5];
    stat->soft_irq = values[6];
    stat->steal = values[7];
    return true;
  }
  return false;
}

bool CpuUsageMonitor::idle_percent(const CpuStat& before, const CpuStat& after,
                                   double* idle) {
  uint64_t old_total = before.total();
  uint64_t new_total = after.total();
  if (new_total <= old_total || after.idle < before.idle) {
    return false;
  }
  double idle_delta = static_cast<double>(after.idle - before.idle);
  double total_delta = static_cast<double>(new_total - old_total);
  *idle = std::clamp(idle_delta / total_delta * 100.0, 0.0, 100.0);
  return true;
}

bool CpuUsageMonitor::usage_percent(const CpuStat& before, const CpuStat& after,
                                    int* usage) {
  uint64_t old_total = before.total();
  uint64_t new_total = after.total();
  if (new_total <= old_total || after.idle < before.idle) {
    return false;
  }
  uint64_t total_delta = new_total - old_total;
  uint64_t idle_delta = std::min(after.idle - before.idle, total_delta);
  uint64_t busy_delta = total_delta - idle_delta;
  *usage = static_cast<int>(busy_delta * 100 / total_delta);
  return true;
}

// 在采样窗口两端读取 /proc/stat，得到窗口内的空闲百分比
bool CpuUsageMonitor::update(hostwatch::proto::SampleInfo* sample_info) {
  CpuStat before;
  if (!read_cpu_stat(_stat_path, &before)) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->warn("Failed to read cpu line from {}", _stat_path);
    return false;
  }

  std::this_thread::sleep_for(_window);

  CpuStat after;
  if (!read_cpu_stat(_stat_path, &after)) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->warn("Failed to read cpu line from {}", _stat_path);
    return false;
  }

  double idle = 100.0;
  int usage = 0;
  if (!idle_percent(before, after, &idle) ||
      !usage_percent(before, after, &usage)) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->warn("CPU counters did not advance within {} ms", _window.count());
    return false;
  }

  auto* cpu_msg = sample_info->mutable_cpu();
  cpu_msg->set_idle_percent(static_cast<float>(idle));
  cpu_msg->set_window_ms(static_cast<uint64_t>(_window.count()));
  sample_info->set_cpu_usage_pct(usage);
  return true;
}

// 读取失败时视为 100% 空闲
void CpuUsageMonitor::apply_default(hostwatch::proto::SampleInfo* sample_info) {
  auto* cpu_msg = sample_info->mutable_cpu();
  cpu_msg->set_idle_percent(100.0f);
  cpu_msg->set_window_ms(static_cast<uint64_t>(_window.count()));
  sample_info->set_cpu_usage_pct(0);
}

}  // namespace hostwatch
