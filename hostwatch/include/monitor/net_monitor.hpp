#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "monitor/monitor.hpp"
#include "sample_info.pb.h"

namespace hostwatch {
class NetMonitor : public Monitor    {
 public:
  struct NetStat {
    std::string name;
    uint64_t rcv_bytes = 0;
    uint64_t rcv_packets = 0;
    uint64_t snd_bytes = 0;
    uint64_t snd_packets = 0;
  };

  NetMonitor(std::string interface,
             std::chrono::milliseconds window = std::chrono::milliseconds(1000),
             std::string net_dev_path = "/proc/net/dev");
  bool update(hostwatch::proto::SampleInfo* sample_info) override;
  void apply_default(hostwatch::proto::SampleInfo* sample_info) override;
  std::string name() const override { return "net"; }

  // 从 /proc/net/dev 格式的文件中读取指定网卡的计数
  static bool read_net_stat(const std::string& net_dev_path,
                            const std::string& interface, NetStat* stat);
  // 字节计数差值换算为 KB/s，计数回绕或重置时记为 0
  static double rate_kbps(uint64_t before, uint64_t after, double seconds);

 private:
  std::string _interface;
  std::chrono::milliseconds _window;
  std::string _net_dev_path;
};

}  // namespace hostwatch
