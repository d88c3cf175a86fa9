#include "alert/alert_cooldown.hpp"

#include "alert/threshold_evaluator.hpp"

namespace hostwatch {

AlertCooldown::AlertCooldown(std::chrono::seconds cooldown)
    : _cooldown(cooldown) {}

std::vector<hostwatch::proto::AlertInfo> AlertCooldown::filter(
    std::vector<hostwatch::proto::AlertInfo> alerts) {
  if (!enabled()) {
    return alerts;
  }

  std::vector<hostwatch::proto::AlertInfo> passed;
  for (auto& alert : alerts) {
    std::string key = alert_label(alert.kind()) + "/" + alert.host();
    auto it = _last_emitted.find(key);
    if (it != _last_emitted.end() &&
        alert.timestamp() - it->second < _cooldown.count()) {
      continue;
    }
    _last_emitted[key] = alert.timestamp();
    passed.push_back(std::move(alert));
  }
  return passed;
}

}  // namespace hostwatch
