#include <signal.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "alert/threshold_evaluator.hpp"
#include "config/config.hpp"
#include "fastlog/fastlog.hpp"
#include "monitor/metric_collector.hpp"
#include "monitor/process_source.hpp"
#include "scheduler/sample_scheduler.hpp"
#include "scheduler/ticker.hpp"
#include "sink/log_sink.hpp"
#include "util/log_name.hpp"

using hostwatch::kHostwatchLoggerName;

int main(int argc, char* argv[]) {
  hostwatch::Config config;
  try {
    config = hostwatch::parse_config(argc, argv);
  } catch (const hostwatch::ConfigError& e) {
    std::cerr << "hostwatch: " << e.what() << "\n" << hostwatch::usage(argv[0]);
    return 1;
  }
  if (config.show_help) {
    std::cout << hostwatch::usage(argv[0]);
    return 0;
  }

  // 在创建任何线程之前屏蔽终止信号，由主线程 sigwait 统一处理
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  std::filesystem::path log_dir = config.log_dir;
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  if (ec) {
    std::cerr << "hostwatch: cannot create log directory " << log_dir << ": "
              << ec.message() << "\n";
    return 1;
  }
  std::string log_path = (log_dir / "hostwatch.log").string();
  auto& log = fastlog::file::make_logger(kHostwatchLoggerName, log_path);
  log.set_level(config.verbose ? fastlog::LogLevel::Debug
                               : fastlog::LogLevel::Info);

  std::cout << "Starting system monitor..." << std::endl;
  log.info("Starting system monitor...");
  log.info("Thresholds: CPU {}%, Disk {}%, Mem {}%, Net {} KB/s",
           config.cpu_threshold, config.disk_threshold, config.mem_threshold,
           config.net_threshold);
  log.info("Interval: {} seconds, interface: {}, hosts: {}",
           config.interval.count(), config.interface, config.hosts.size());
  log.info("Metrics log: {}, alert log: {}, spike log: {}", config.metrics_log,
           config.alert_log, config.spike_log);
  if (config.alert_cooldown.count() > 0) {
    log.warn("Alert cooldown enabled: repeated alerts within {} seconds are suppressed",
             config.alert_cooldown.count());
  }

  hostwatch::MetricCollector collector(
      hostwatch::MetricCollector::make_default_monitors(config));
  hostwatch::ProcProcessSource process_source;
  hostwatch::ThresholdEvaluator evaluator(config, &process_source);

  hostwatch::AppendFileSink metrics_sink(config.metrics_log);
  hostwatch::AppendFileSink alert_sink(config.alert_log);
  hostwatch::AppendFileSink spike_sink(config.spike_log);
  hostwatch::SinkSet sinks;
  sinks.metrics = &metrics_sink;
  sinks.alerts = &alert_sink;
  sinks.diagnostics = &spike_sink;

  hostwatch::SteadyTicker ticker;
  hostwatch::SampleScheduler scheduler(config, &collector, &evaluator, sinks,
                                       &ticker);
  if (!scheduler.write_banner()) {
    log.error("Failed to write startup banner, will retry with the next records");
  }
  scheduler.start();

  log.info("Press Ctrl+C to exit.");
  int received = 0;
  sigwait(&signals, &received);

  log.info("Received signal {}, stopping after the current cycle", received);
  scheduler.stop();
  log.info("System monitor stopped");
  log.flush();
  return 0;
}
