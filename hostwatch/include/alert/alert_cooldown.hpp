#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "sample_info.pb.h"

namespace hostwatch {

/**
 * 告警冷却（可选，默认关闭）
 *
 * 默认行为是每个越界周期都产生新告警。开启后，同一类别（连通性告警按主机区分）
 * 在冷却时间内只保留第一条。冷却时间为 0 时原样返回。
 */
class AlertCooldown {
 public:
  explicit AlertCooldown(std::chrono::seconds cooldown);

  std::vector<hostwatch::proto::AlertInfo> filter(
      std::vector<hostwatch::proto::AlertInfo> alerts);

  bool enabled() const { return _cooldown.count() > 0; }

 private:
  std::chrono::seconds _cooldown;
  // 告警键 -> 上次放行的时间戳
  std::unordered_map<std::string, int64_t> _last_emitted;
};

}  // namespace hostwatch
