#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "monitor/monitor.hpp"
#include "sample_info.pb.h"

namespace hostwatch {
class CpuUsageMonitor : public Monitor {
 public:
  // /proc/stat 中聚合 cpu 行的累计时间
  struct CpuStat {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t io_wait = 0;
    uint64_t irq = 0;
    uint64_t soft_irq = 0;
    uint64_t steal = 0;

    uint64_t total() const {
      return user + nice + system + idle + io_wait + irq + soft_irq + steal;
    }
  };

  explicit CpuUsageMonitor(
      std::chrono::milliseconds window = std::chrono::milliseconds(1000),
      std::string stat_path = "/proc/stat");

  bool update(hostwatch::proto::SampleInfo* sample_info) override;
  void apply_default(hostwatch::proto::SampleInfo* sample_info) override;
  std::string name() const override { return "cpu"; }

  // 读取 stat_path 的聚合 cpu 行
  static bool read_cpu_stat(const std::string& stat_path, CpuStat* stat);
  // 由两次读数计算空闲百分比，时间未前进时返回 false
  static bool idle_percent(const CpuStat& before, const CpuStat& after,
                           double* idle);
  // 使用率 = 100 - 空闲，截断为整数；整数运算，避免浮点误差跨过整数边界
  static bool usage_percent(const CpuStat& before, const CpuStat& after,
                            int* usage);

 private:
  std::chrono::milliseconds _window;
  std::string _stat_path;
};

}  // namespace hostwatch
