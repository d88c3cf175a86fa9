#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostwatch {

constexpr int kDefaultCpuThreshold = 80;      // 百分比
constexpr int kDefaultDiskThreshold = 60;     // 百分比
constexpr int kDefaultMemThreshold = 80;      // 百分比
constexpr int64_t kDefaultNetThreshold = 102400;  // KB/s，即 100 MB/s
constexpr int kDefaultInterval = 60;          // 秒
constexpr char kDefaultInterface[] = "eth0";
constexpr char kDefaultMetricsLog[] = "system_load.log";
constexpr char kDefaultAlertLog[] = "alerts.log";
constexpr char kDefaultSpikeLog[] = "cpu_spike_details.log";
constexpr char kDefaultLogDir[] = "/tmp/hostwatch_logs";
constexpr char kDefaultDiskPath[] = "/";
constexpr int kDefaultSampleWindowMs = 1000;
constexpr int kDefaultProbeTimeout = 2;       // 秒
// 间隔、探测超时与告警冷却的上限：一天
constexpr int64_t kMaxDurationSeconds = 86400;

// 启动配置错误，进入主循环前即终止进程
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// 进程生命周期内只读的配置，启动时构建一次，按引用传递
struct Config {
  int cpu_threshold = kDefaultCpuThreshold;
  int disk_threshold = kDefaultDiskThreshold;
  int mem_threshold = kDefaultMemThreshold;
  int64_t net_threshold = kDefaultNetThreshold;
  std::vector<std::string> hosts = {"8.8.8.8", "1.1.1.1", "1.0.0.1", "9.9.9.9"};
  std::string interface = kDefaultInterface;

  std::chrono::seconds interval{kDefaultInterval};
  std::chrono::milliseconds sample_window{kDefaultSampleWindowMs};
  std::chrono::seconds probe_timeout{kDefaultProbeTimeout};
  // 0 表示关闭冷却，每次越界都产生告警
  std::chrono::seconds alert_cooldown{0};

  std::string metrics_log = kDefaultMetricsLog;
  std::string alert_log = kDefaultAlertLog;
  std::string spike_log = kDefaultSpikeLog;
  std::string log_dir = kDefaultLogDir;
  std::string disk_path = kDefaultDiskPath;

  bool verbose = false;
  bool show_help = false;
};

// 解析命令行参数（--name value 或 --name=value），失败抛出 ConfigError
Config parse_config(int argc, char* argv[]);

// 校验取值范围，失败抛出 ConfigError
void validate_config(const Config& config);

std::string usage(const char* program);

}  // namespace hostwatch
