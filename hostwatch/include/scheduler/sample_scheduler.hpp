#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "alert/alert_cooldown.hpp"
#include "alert/threshold_evaluator.hpp"
#include "config/config.hpp"
#include "monitor/metric_collector.hpp"
#include "scheduler/ticker.hpp"
#include "sink/log_sink.hpp"

namespace hostwatch {

enum class SchedulerState {
  kIdle,
  kCollecting,
  kEvaluating,
  kPersisting,
  kSleeping,
  kStopped,
};

const char* state_name(SchedulerState state);

// 三个输出：指标日志、告警日志、CPU 峰值诊断日志
struct SinkSet {
  LogSink* metrics = nullptr;
  LogSink* alerts = nullptr;
  LogSink* diagnostics = nullptr;
};

/**
 * 采样调度器
 *
 * 单线程顺序执行 采集 -> 判定 -> 写入 -> 休眠。休眠时长固定为配置的间隔，
 * 不扣除采集耗时；上一个周期写入完成之前不会开始下一个周期的采集。
 * stop() 取消休眠，正在进行的周期会完成写入后退出，退出前再重试一次积压的记录。
 */
class SampleScheduler {
 public:
  SampleScheduler(const Config& config, MetricCollector* collector,
                  ThresholdEvaluator* evaluator, SinkSet sinks,
                  Ticker* ticker);
  ~SampleScheduler();

  // 启动横幅写入指标日志与告警日志
  bool write_banner();

  // 在后台线程中运行 run()
  void start();

  // 取消休眠并等待后台线程退出
  void stop();

  // 循环执行周期直到 ticker 被取消
  void run();

  // 执行一个完整周期，全部写入成功返回 true
  bool run_once();

  SchedulerState state() const { return _state.load(); }
  uint64_t cycles() const { return _cycles.load(); }

 private:
  // 重试三个输出中积压的记录
  bool flush_sinks();
  bool persist(const hostwatch::proto::SampleInfo& sample,
               const std::vector<hostwatch::proto::AlertInfo>& connectivity,
               const std::vector<hostwatch::proto::AlertInfo>& alerts,
               const hostwatch::proto::CpuSpikeReport* spike);

  const Config& _config;
  MetricCollector* _collector;
  ThresholdEvaluator* _evaluator;
  SinkSet _sinks;
  Ticker* _ticker;
  AlertCooldown _cooldown;
  std::atomic<SchedulerState> _state;
  std::atomic<uint64_t> _cycles;
  std::unique_ptr<std::thread> _thread;
};

}  // namespace hostwatch
