#include "config/config.hpp"

#include <net/if.h>

#include <limits>
#include <sstream>

namespace hostwatch {

namespace {

int64_t parse_integer(const std::string& option, const std::string& value) {
  size_t pos = 0;
  int64_t result = 0;
  try {
    result = std::stoll(value, &pos);
  } catch (const std::exception&) {
    throw ConfigError("invalid value for " + option + ": '" + value + "'");
  }
  if (pos != value.size()) {
    throw ConfigError("invalid value for " + option + ": '" + value + "'");
  }
  return result;
}

// 收窄为 int 前先检查范围，避免超大数值回绕成合法值
int parse_int(const std::string& option, const std::string& value) {
  int64_t result = parse_integer(option, value);
  if (result < std::numeric_limits<int>::min() ||
      result > std::numeric_limits<int>::max()) {
    throw ConfigError("value out of range for " + option + ": '" + value + "'");
  }
  return static_cast<int>(result);
}

void check_seconds(const char* option, std::chrono::seconds value, int64_t min) {
  if (value.count() < min || value.count() > kMaxDurationSeconds) {
    throw ConfigError(std::string(option) + " must be within " +
                      std::to_string(min) + "-" +
                      std::to_string(kMaxDurationSeconds) + " seconds, got " +
                      std::to_string(value.count()));
  }
}

std::vector<std::string> split_hosts(const std::string& value) {
  std::vector<std::string> hosts;
  std::istringstream iss(value);
  std::string host;
  while (std::getline(iss, host, ',')) {
    hosts.push_back(host);
  }
  // "a," 这种尾部逗号也视为空主机
  if (!value.empty() && value.back() == ',') {
    hosts.push_back("");
  }
  return hosts;
}

void check_percent(const char* option, int value) {
  if (value < 0 || value > 100) {
    throw ConfigError(std::string(option) + " must be within 0-100, got " +
                      std::to_string(value));
  }
}

}  // namespace

Config parse_config(int argc, char* argv[]) {
  Config config;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
      continue;
    }
    if (arg == "--verbose") {
      config.verbose = true;
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      throw ConfigError("unexpected argument: " + arg);
    }

    std::string name = arg;
    std::string value;
    auto eq = arg.find('=');
    if (eq != std::string::npos) {
      name = arg.substr(0, eq);
      value = arg.substr(eq + 1);
    } else {
      if (i + 1 >= argc) {
        throw ConfigError("missing value for " + name);
      }
      value = argv[++i];
    }

    if (name == "--cpu-threshold") {
      config.cpu_threshold = parse_int(name, value);
    } else if (name == "--disk-threshold") {
      config.disk_threshold = parse_int(name, value);
    } else if (name == "--mem-threshold") {
      config.mem_threshold = parse_int(name, value);
    } else if (name == "--net-threshold") {
      config.net_threshold = parse_integer(name, value);
    } else if (name == "--interval") {
      config.interval = std::chrono::seconds(parse_integer(name, value));
    } else if (name == "--interface") {
      config.interface = value;
    } else if (name == "--hosts") {
      config.hosts = split_hosts(value);
    } else if (name == "--metrics-log") {
      config.metrics_log = value;
    } else if (name == "--alert-log") {
      config.alert_log = value;
    } else if (name == "--spike-log") {
      config.spike_log = value;
    } else if (name == "--log-dir") {
      config.log_dir = value;
    } else if (name == "--disk-path") {
      config.disk_path = value;
    } else if (name == "--sample-window") {
      config.sample_window = std::chrono::milliseconds(parse_integer(name, value));
    } else if (name == "--probe-timeout") {
      config.probe_timeout = std::chrono::seconds(parse_integer(name, value));
    } else if (name == "--alert-cooldown") {
      config.alert_cooldown = std::chrono::seconds(parse_integer(name, value));
    } else {
      throw ConfigError("unknown option: " + name);
    }
  }

  validate_config(config);
  return config;
}

void validate_config(const Config& config) {
  check_percent("--cpu-threshold", config.cpu_threshold);
  check_percent("--disk-threshold", config.disk_threshold);
  check_percent("--mem-threshold", config.mem_threshold);
  if (config.net_threshold < 0) {
    throw ConfigError("--net-threshold must not be negative");
  }
  check_seconds("--interval", config.interval, 1);
  if (config.sample_window.count() < 1 || config.sample_window.count() > 10000) {
    throw ConfigError("--sample-window must be within 1-10000 ms");
  }
  check_seconds("--probe-timeout", config.probe_timeout, 1);
  check_seconds("--alert-cooldown", config.alert_cooldown, 0);
  if (config.interface.empty()) {
    throw ConfigError("--interface must not be empty");
  }
  if (config.interface.size() >= IFNAMSIZ) {
    throw ConfigError("--interface name too long: " + config.interface);
  }
  if (config.hosts.empty()) {
    throw ConfigError("--hosts must list at least one host");
  }
  for (const auto& host : config.hosts) {
    // 主机名会作为 ping 的参数，拒绝空值与以 '-' 开头的值
    if (host.empty() || host[0] == '-') {
      throw ConfigError("invalid host in --hosts: '" + host + "'");
    }
  }
  if (config.metrics_log.empty() || config.alert_log.empty() ||
      config.spike_log.empty()) {
    throw ConfigError("log file paths must not be empty");
  }
}

std::string usage(const char* program) {
  std::ostringstream oss;
  oss << "Usage: " << program << " [options]\n"
      << "  --cpu-threshold N    CPU usage alert threshold in percent (default "
      << kDefaultCpuThreshold << ")\n"
      << "  --disk-threshold N   root filesystem usage threshold in percent (default "
      << kDefaultDiskThreshold << ")\n"
      << "  --mem-threshold N    memory usage threshold in percent (default "
      << kDefaultMemThreshold << ")\n"
      << "  --net-threshold N    network throughput threshold in KB/s (default "
      << kDefaultNetThreshold << ")\n"
      << "  --interval N         seconds between cycles (default " << kDefaultInterval
      << ")\n"
      << "  --interface NAME     network interface to sample (default "
      << kDefaultInterface << ")\n"
      << "  --hosts A,B,...      hosts probed for connectivity\n"
      << "  --metrics-log PATH   metrics log (default " << kDefaultMetricsLog << ")\n"
      << "  --alert-log PATH     alert log (default " << kDefaultAlertLog << ")\n"
      << "  --spike-log PATH     CPU spike log (default " << kDefaultSpikeLog << ")\n"
      << "  --log-dir DIR        operational log directory (default "
      << kDefaultLogDir << ")\n"
      << "  --disk-path PATH     filesystem sampled for disk usage (default "
      << kDefaultDiskPath << ")\n"
      << "  --sample-window MS   CPU/network sampling window (default "
      << kDefaultSampleWindowMs << ")\n"
      << "  --probe-timeout N    ping timeout in seconds (default "
      << kDefaultProbeTimeout << ")\n"
      << "  --alert-cooldown N   suppress repeats of the same alert for N seconds"
      << " (default 0, off)\n"
      << "  --verbose            debug level operational logging\n"
      << "  --help               show this message\n";
  return oss.str();
}

}  // namespace hostwatch
