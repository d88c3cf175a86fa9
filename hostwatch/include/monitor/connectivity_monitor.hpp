#pragma once

#include <memory>
#include <string>
#include <vector>

#include "monitor/host_prober.hpp"
#include "monitor/monitor.hpp"
#include "sample_info.pb.h"

namespace hostwatch {

// 按配置顺序逐个探测主机，任一主机不可达则整体为 FAIL
class ConnectivityMonitor : public Monitor {
 public:
  ConnectivityMonitor(std::vector<std::string> hosts,
                      std::unique_ptr<HostProber> prober);

  bool update(hostwatch::proto::SampleInfo* sample_info) override;
  void apply_default(hostwatch::proto::SampleInfo* sample_info) override;
  std::string name() const override { return "connectivity"; }

 private:
  std::vector<std::string> _hosts;
  std::unique_ptr<HostProber> _prober;
};

}  // namespace hostwatch
