#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hostwatch {

// 可取消的等待，调度器在两个周期之间通过它休眠
class Ticker {
 public:
  virtual ~Ticker() {}
  // 等待 interval；被取消时立即返回 false
  virtual bool wait(std::chrono::seconds interval) = 0;
  // 取消后所有后续 wait 都立即返回 false
  virtual void cancel() = 0;
  virtual bool cancelled() const = 0;
};

class SteadyTicker : public Ticker {
 public:
  SteadyTicker() = default;

  bool wait(std::chrono::seconds interval) override;
  void cancel() override;
  bool cancelled() const override;

 private:
  mutable std::mutex _mtx;
  std::condition_variable _cv;
  bool _cancelled = false;
};

}  // namespace hostwatch
