// ============================================================================
// THRESHOLD EVALUATOR UNIT TESTS
// ============================================================================
// Strict greater-than policy, purity, CPU spike capture and optional cooldown
// ============================================================================

#include <gtest/gtest.h>
#include <google/protobuf/util/message_differencer.h>

#include <string>
#include <vector>

#include "alert/alert_cooldown.hpp"
#include "alert/threshold_evaluator.hpp"
#include "config/config.hpp"
#include "monitor/process_source.hpp"

using namespace hostwatch;

namespace {

class FakeProcessSource : public ProcessSource {
 public:
  std::vector<proto::ProcessInfo> top_by_cpu(size_t limit) override {
    ++calls;
    requested_limit = limit;
    std::vector<proto::ProcessInfo> result;
    for (int pid = 1; pid <= 7 && result.size() < limit; ++pid) {
      proto::ProcessInfo info;
      info.set_pid(pid);
      info.set_user("root");
      info.set_cpu_percent(100.0 - pid);
      info.set_command("proc" + std::to_string(pid));
      result.push_back(info);
    }
    return result;
  }

  int calls = 0;
  size_t requested_limit = 0;
};

proto::SampleInfo make_sample(int cpu, int disk, int mem, int64_t net) {
  proto::SampleInfo sample;
  sample.set_timestamp(1700000000);
  sample.set_cpu_usage_pct(cpu);
  sample.set_disk_usage_pct(disk);
  sample.set_mem_usage_pct(mem);
  sample.set_net_total_kbps(net);
  return sample;
}

proto::AlertInfo alert_at(proto::AlertKind kind, int64_t ts,
                          const std::string& host = "") {
  proto::AlertInfo alert;
  alert.set_kind(kind);
  alert.set_timestamp(ts);
  alert.set_host(host);
  return alert;
}

}  // namespace

// ============================================================================
// THRESHOLDS
// ============================================================================

TEST(ThresholdEvaluator, CpuAboveThresholdEmitsOneAlert) {
  Config config;
  FakeProcessSource source;
  ThresholdEvaluator evaluator(config, &source);

  auto alerts = evaluator.evaluate(make_sample(81, 0, 0, 0));
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].kind(), proto::ALERT_KIND_CPU);
  EXPECT_EQ(alerts[0].severity(), proto::SEVERITY_BREACH);
  EXPECT_EQ(alerts[0].message(), "Usage is 81%, exceeding threshold of 80%.");
  EXPECT_EQ(alerts[0].timestamp(), 1700000000);
}

TEST(ThresholdEvaluator, EqualToThresholdEmitsNothing) {
  Config config;
  ThresholdEvaluator evaluator(config, nullptr);
  EXPECT_TRUE(evaluator.evaluate(make_sample(80, 60, 80, 102400)).empty());
}

TEST(ThresholdEvaluator, AllBreachesInFixedOrder) {
  Config config;
  ThresholdEvaluator evaluator(config, nullptr);
  auto alerts = evaluator.evaluate(make_sample(95, 61, 81, 102401));
  ASSERT_EQ(alerts.size(), 4u);
  EXPECT_EQ(alerts[0].kind(), proto::ALERT_KIND_CPU);
  EXPECT_EQ(alerts[1].kind(), proto::ALERT_KIND_DISK);
  EXPECT_EQ(alerts[1].message(), "Usage is 61%, exceeding threshold of 60%.");
  EXPECT_EQ(alerts[2].kind(), proto::ALERT_KIND_MEM);
  EXPECT_EQ(alerts[2].message(), "Usage is 81%, exceeding threshold of 80%.");
  EXPECT_EQ(alerts[3].kind(), proto::ALERT_KIND_NET);
  EXPECT_EQ(alerts[3].message(),
            "Usage is 102401 KB/s, exceeding threshold of 102400 KB/s.");
}

TEST(ThresholdEvaluator, UsesConfiguredThresholds) {
  Config config;
  config.mem_threshold = 50;
  config.net_threshold = 10;
  ThresholdEvaluator evaluator(config, nullptr);
  auto alerts = evaluator.evaluate(make_sample(0, 0, 51, 11));
  ASSERT_EQ(alerts.size(), 2u);
  EXPECT_EQ(alerts[0].kind(), proto::ALERT_KIND_MEM);
  EXPECT_EQ(alerts[1].kind(), proto::ALERT_KIND_NET);
}

TEST(ThresholdEvaluator, EvaluationIsPure) {
  Config config;
  ThresholdEvaluator evaluator(config, nullptr);
  auto sample = make_sample(90, 70, 90, 200000);
  auto first = evaluator.evaluate(sample);
  auto second = evaluator.evaluate(sample);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_TRUE(google::protobuf::util::MessageDifferencer::Equals(first[i], second[i]));
  }
}

TEST(ThresholdEvaluator, ConsecutiveBreachesAreNotDeduplicated) {
  Config config;
  ThresholdEvaluator evaluator(config, nullptr);
  size_t total = 0;
  for (int cycle = 0; cycle < 2; ++cycle) {
    total += evaluator.evaluate(make_sample(85, 0, 0, 0)).size();
  }
  EXPECT_EQ(total, 2u);
}

TEST(AlertLabel, MatchesAlertLogKinds) {
  EXPECT_EQ(alert_label(proto::ALERT_KIND_CPU), "CPU");
  EXPECT_EQ(alert_label(proto::ALERT_KIND_DISK), "DISK");
  EXPECT_EQ(alert_label(proto::ALERT_KIND_MEM), "MEMORY");
  EXPECT_EQ(alert_label(proto::ALERT_KIND_NET), "NETWORK");
  EXPECT_EQ(alert_label(proto::ALERT_KIND_CONNECTIVITY), "CONNECTIVITY");
}

// ============================================================================
// CPU SPIKE CAPTURE
// ============================================================================

TEST(ThresholdEvaluator, CpuAlertCapturesTopFiveProcesses) {
  Config config;
  FakeProcessSource source;
  ThresholdEvaluator evaluator(config, &source);
  auto sample = make_sample(81, 0, 0, 0);
  auto alerts = evaluator.evaluate(sample);

  proto::CpuSpikeReport report;
  ASSERT_TRUE(evaluator.capture_cpu_spike(sample, alerts, &report));
  EXPECT_EQ(source.calls, 1);
  EXPECT_EQ(source.requested_limit, ThresholdEvaluator::kTopProcessCount);
  EXPECT_EQ(report.cpu_usage_pct(), 81);
  EXPECT_EQ(report.timestamp(), 1700000000);
  ASSERT_EQ(report.processes_size(), 5);
  EXPECT_EQ(report.processes(0).pid(), 1);
}

TEST(ThresholdEvaluator, NoCpuAlertNoCapture) {
  Config config;
  FakeProcessSource source;
  ThresholdEvaluator evaluator(config, &source);
  auto sample = make_sample(80, 99, 99, 0);
  auto alerts = evaluator.evaluate(sample);
  ASSERT_EQ(alerts.size(), 2u);

  proto::CpuSpikeReport report;
  EXPECT_FALSE(evaluator.capture_cpu_spike(sample, alerts, &report));
  EXPECT_EQ(source.calls, 0);
}

// ============================================================================
// COOLDOWN
// ============================================================================

TEST(AlertCooldown, DisabledPassesEverything) {
  AlertCooldown cooldown(std::chrono::seconds(0));
  EXPECT_FALSE(cooldown.enabled());
  auto first = cooldown.filter({alert_at(proto::ALERT_KIND_CPU, 100)});
  auto second = cooldown.filter({alert_at(proto::ALERT_KIND_CPU, 100)});
  EXPECT_EQ(first.size(), 1u);
  EXPECT_EQ(second.size(), 1u);
}

TEST(AlertCooldown, SuppressesRepeatsWithinWindow) {
  AlertCooldown cooldown(std::chrono::seconds(300));
  EXPECT_EQ(cooldown.filter({alert_at(proto::ALERT_KIND_CPU, 0)}).size(), 1u);
  EXPECT_EQ(cooldown.filter({alert_at(proto::ALERT_KIND_CPU, 60)}).size(), 0u);
  // 其他类别不受影响
  EXPECT_EQ(cooldown.filter({alert_at(proto::ALERT_KIND_DISK, 60)}).size(), 1u);
  EXPECT_EQ(cooldown.filter({alert_at(proto::ALERT_KIND_CPU, 300)}).size(), 1u);
}

TEST(AlertCooldown, ConnectivityKeyedByHost) {
  AlertCooldown cooldown(std::chrono::seconds(300));
  auto passed = cooldown.filter({alert_at(proto::ALERT_KIND_CONNECTIVITY, 0, "A"),
                                 alert_at(proto::ALERT_KIND_CONNECTIVITY, 0, "B")});
  EXPECT_EQ(passed.size(), 2u);
  passed = cooldown.filter({alert_at(proto::ALERT_KIND_CONNECTIVITY, 60, "A")});
  EXPECT_TRUE(passed.empty());
}
