#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.hpp"
#include "monitor/monitor.hpp"
#include "sample_info.pb.h"

namespace hostwatch {

class MetricCollector {
 public:
  explicit MetricCollector(std::vector<std::unique_ptr<Monitor>> monitors);
  ~MetricCollector();

  // 按配置创建 CPU、磁盘、内存、网络、连通性五个监控器
  static std::vector<std::unique_ptr<Monitor>> make_default_monitors(
      const Config& config);

  // 采集所有指标并填充到 SampleInfo；失败的监控器写入默认值，不影响其他维度
  // 返回采集失败的监控器数量
  int collect_all(hostwatch::proto::SampleInfo* sample_info);

 private:
  std::vector<std::unique_ptr<Monitor>> _monitors;
};

}  // namespace hostwatch
