#include "scheduler/sample_scheduler.hpp"

#include <ctime>
#include <initializer_list>

#include "fastlog/fastlog.hpp"
#include "sink/record_format.hpp"
#include "util/log_name.hpp"

namespace hostwatch {

const char* state_name(SchedulerState state) {
  switch (state) {
    case SchedulerState::kIdle:
      return "IDLE";
    case SchedulerState::kCollecting:
      return "COLLECTING";
    case SchedulerState::kEvaluating:
      return "EVALUATING";
    case SchedulerState::kPersisting:
      return "PERSISTING";
    case SchedulerState::kSleeping:
      return "SLEEPING";
    case SchedulerState::kStopped:
      return "STOPPED";
  }
  return "UNKNOWN";
}

SampleScheduler::SampleScheduler(const Config& config,
                                 MetricCollector* collector,
                                 ThresholdEvaluator* evaluator, SinkSet sinks,
                                 Ticker* ticker)
    : _config(config),
      _collector(collector),
      _evaluator(evaluator),
      _sinks(sinks),
      _ticker(ticker),
      _cooldown(config.alert_cooldown),
      _state(SchedulerState::kIdle),
      _cycles(0) {}

SampleScheduler::~SampleScheduler() {
  stop();
}

bool SampleScheduler::write_banner() {
  std::string banner = format_banner(static_cast<int64_t>(::time(nullptr)));
  bool metrics_ok = _sinks.metrics->append(banner);
  bool alerts_ok = _sinks.alerts->append(banner);
  return metrics_ok && alerts_ok;
}

void SampleScheduler::start() {
  if (_thread) {
    return;
  }
  _thread = std::make_unique<std::thread>(&SampleScheduler::run, this);
  auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
  if (log) log->info("SampleScheduler started, sampling every {} seconds", _config.interval.count());
}

void SampleScheduler::stop() {
  _ticker->cancel();
  if (_thread && _thread->joinable()) {
    _thread->join();
  }
  _thread.reset();
  if (!flush_sinks()) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->error("Records still pending at shutdown were not written");
  }
}

bool SampleScheduler::flush_sinks() {
  bool ok = true;
  for (LogSink* sink : {_sinks.metrics, _sinks.alerts, _sinks.diagnostics}) {
    if (sink) ok = sink->flush_pending() && ok;
  }
  return ok;
}

void SampleScheduler::run() {
  while (!_ticker->cancelled()) {
    if (!run_once()) {
      auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
      if (log) log->error("Cycle {} finished with unwritten records", _cycles.load());
    }

    // 等待指定间隔，不扣除本周期耗时
    _state = SchedulerState::kSleeping;
    if (!_ticker->wait(_config.interval)) {
      break;
    }
    _state = SchedulerState::kIdle;
  }
  _state = SchedulerState::kStopped;
  auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
  if (log) log->info("SampleScheduler stopped after {} cycles", _cycles.load());
}

bool SampleScheduler::run_once() {
  // 采集
  _state = SchedulerState::kCollecting;
  hostwatch::proto::SampleInfo sample;
  int failures = _collector->collect_all(&sample);
  auto connectivity = _cooldown.filter(connectivity_alerts(sample));

  // 判定
  _state = SchedulerState::kEvaluating;
  auto alerts = _cooldown.filter(_evaluator->evaluate(sample));
  hostwatch::proto::CpuSpikeReport spike;
  bool has_spike = _evaluator->capture_cpu_spike(sample, alerts, &spike);

  // 写入
  _state = SchedulerState::kPersisting;
  bool ok = persist(sample, connectivity, alerts, has_spike ? &spike : nullptr);

  auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
  if (log) {
    log->debug("Sample: {}", sample.ShortDebugString());
    log->info("Cycle {}: CPU {}% Disk {}% Mem {}% Net {} KB/s, {} alerts, {} monitor failures",
              _cycles.load() + 1, sample.cpu_usage_pct(), sample.disk_usage_pct(),
              sample.mem_usage_pct(), sample.net_total_kbps(),
              connectivity.size() + alerts.size(), failures);
    log->flush();
  }

  ++_cycles;
  _state = SchedulerState::kIdle;
  return ok;
}

// 写入顺序：连通性告警、指标行、CPU/磁盘/内存/网络告警；CPU 告警之后紧跟诊断块
bool SampleScheduler::persist(
    const hostwatch::proto::SampleInfo& sample,
    const std::vector<hostwatch::proto::AlertInfo>& connectivity,
    const std::vector<hostwatch::proto::AlertInfo>& alerts,
    const hostwatch::proto::CpuSpikeReport* spike) {
  // 上个周期失败的记录在本周期重试，即使本周期没有新记录
  bool ok = flush_sinks();
  for (const auto& alert : connectivity) {
    ok = _sinks.alerts->append(format_alert_line(alert)) && ok;
  }

  ok = _sinks.metrics->append(format_metrics_line(sample)) && ok;

  for (const auto& alert : alerts) {
    ok = _sinks.alerts->append(format_alert_line(alert)) && ok;
    if (alert.kind() == hostwatch::proto::ALERT_KIND_CPU && spike != nullptr) {
      ok = _sinks.diagnostics->append(format_spike_block(*spike)) && ok;
    }
  }
  return ok;
}

}  // namespace hostwatch
