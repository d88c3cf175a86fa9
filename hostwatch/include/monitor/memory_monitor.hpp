#pragma once

#include "monitor/monitor.hpp"
#include "sample_info.pb.h"
#include <cstdint>
#include <string>

namespace hostwatch {
class MemoryMonitor : public Monitor {
public:
  // 内部结构体，用于存储 /proc/meminfo 中需要的字段，单位 KB
  struct MemInfo {
    int64_t total = -1;
    int64_t free = -1;
    int64_t avail = -1;
    int64_t buffers = 0;
    int64_t cached = 0;
    int64_t sReclaimable = 0;
  };

  explicit MemoryMonitor(std::string meminfo_path = "/proc/meminfo");
  bool update(hostwatch::proto::SampleInfo *sample_info) override;
  void apply_default(hostwatch::proto::SampleInfo *sample_info) override;
  std::string name() const override { return "memory"; }

  static bool read_mem_info(const std::string &meminfo_path, MemInfo *info);
  // 已用内存，优先使用 MemAvailable，老内核按 free(1) 的口径回退
  static int64_t used_kb(const MemInfo &info);
  // used/total*100，截断为整数
  static int usage_percent(const MemInfo &info);

private:
  std::string _meminfo_path;
};
} // namespace hostwatch
