#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "config/config.hpp"
#include "monitor/process_source.hpp"
#include "sample_info.pb.h"

namespace hostwatch {

// 告警日志中使用的类别名称：CPU / DISK / MEMORY / NETWORK / CONNECTIVITY
std::string alert_label(hostwatch::proto::AlertKind kind);

// 每个不可达主机生成一条连通性告警，按配置顺序
std::vector<hostwatch::proto::AlertInfo> connectivity_alerts(
    const hostwatch::proto::SampleInfo& sample);

/**
 * 阈值判定
 *
 * evaluate() 只依赖样本与配置，没有内部状态，同一输入总是得到相同的告警列表。
 * 所有比较都是严格大于：阈值 80 时 80% 不告警，81% 告警。
 * CPU 告警触发时由 capture_cpu_spike() 采集占用最高的进程。
 */
class ThresholdEvaluator {
 public:
  static constexpr size_t kTopProcessCount = 5;

  ThresholdEvaluator(const Config& config, ProcessSource* process_source);

  // 依次检查 CPU、磁盘、内存、网络
  std::vector<hostwatch::proto::AlertInfo> evaluate(
      const hostwatch::proto::SampleInfo& sample) const;

  // alerts 中含 CPU 告警时填充 report 并返回 true
  bool capture_cpu_spike(const hostwatch::proto::SampleInfo& sample,
                         const std::vector<hostwatch::proto::AlertInfo>& alerts,
                         hostwatch::proto::CpuSpikeReport* report) const;

 private:
  const Config& _config;
  ProcessSource* _process_source;
};

}  // namespace hostwatch
