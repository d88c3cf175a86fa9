#pragma once

#include <chrono>
#include <string>

namespace hostwatch {

// 单个主机的可达性探测接口，实现需自带超时
class HostProber {
 public:
  virtual ~HostProber() {}
  virtual bool probe(const std::string& host) = 0;
};

/**
 * 调用系统 ping 进行探测
 *
 * 等价于 `ping -c <attempts> -W <timeout> <host>`，输出丢弃，
 * 退出码为 0 视为可达；ping 无法启动时视为不可达。
 */
class PingProber : public HostProber {
 public:
  explicit PingProber(std::chrono::seconds timeout = std::chrono::seconds(2),
                      int attempts = 1, std::string ping_program = "ping");

  bool probe(const std::string& host) override;

 private:
  std::chrono::seconds _timeout;
  int _attempts;
  std::string _ping_program;
};

}  // namespace hostwatch
