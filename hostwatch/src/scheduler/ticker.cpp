#include "scheduler/ticker.hpp"

namespace hostwatch {

bool SteadyTicker::wait(std::chrono::seconds interval) {
  std::unique_lock<std::mutex> lock(_mtx);
  // wait_for 的谓词版本会处理虚假唤醒
  _cv.wait_for(lock, interval, [this]() { return _cancelled; });
  return !_cancelled;
}

void SteadyTicker::cancel() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _cancelled = true;
  }
  _cv.notify_all();
}

bool SteadyTicker::cancelled() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _cancelled;
}

}  // namespace hostwatch
