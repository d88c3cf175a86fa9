#pragma once

#include <cstdint>
#include <string>
#include "monitor/monitor.hpp"
#include "sample_info.pb.h"

namespace hostwatch {

// 文件系统使用率监控器，默认统计根文件系统
class DiskMonitor : public Monitor {
 public:
  explicit DiskMonitor(std::string mount_point = "/");
  bool update(hostwatch::proto::SampleInfo* sample_info) override;
  void apply_default(hostwatch::proto::SampleInfo* sample_info) override;
  std::string name() const override { return "disk"; }

  // 与 df 相同的口径：used / (used + avail) 向上取整
  static int usage_percent(uint64_t used_bytes, uint64_t avail_bytes);

 private:
  std::string _mount_point;
};

}  // namespace hostwatch
