// ============================================================================
// CONNECTIVITY UNIT TESTS
// ============================================================================
// Per-host probing, overall status and per-host alerts
// ============================================================================

#include <gtest/gtest.h>

#include <signal.h>
#include <sys/stat.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "alert/threshold_evaluator.hpp"
#include "monitor/connectivity_monitor.hpp"
#include "monitor/host_prober.hpp"
#include "test_util.hpp"

using namespace hostwatch;

namespace {

class FakeProber : public HostProber {
 public:
  FakeProber(std::set<std::string> unreachable, std::vector<std::string>* probed)
      : _unreachable(std::move(unreachable)), _probed(probed) {}

  bool probe(const std::string& host) override {
    _probed->push_back(host);
    return _unreachable.count(host) == 0;
  }

 private:
  std::set<std::string> _unreachable;
  std::vector<std::string>* _probed;
};

}  // namespace

// ============================================================================
// CONNECTIVITY MONITOR
// ============================================================================

TEST(ConnectivityMonitor, OneUnreachableHostMeansFail) {
  std::vector<std::string> probed;
  ConnectivityMonitor monitor({"A", "B"},
                              std::make_unique<FakeProber>(std::set<std::string>{"B"}, &probed));
  proto::SampleInfo sample;
  sample.set_timestamp(1700000000);
  ASSERT_TRUE(monitor.update(&sample));

  EXPECT_EQ(sample.connectivity(), proto::CONNECTIVITY_FAIL);
  ASSERT_EQ(sample.host_probes_size(), 2);
  EXPECT_TRUE(sample.host_probes(0).reachable());
  EXPECT_FALSE(sample.host_probes(1).reachable());

  auto alerts = connectivity_alerts(sample);
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].kind(), proto::ALERT_KIND_CONNECTIVITY);
  EXPECT_EQ(alerts[0].host(), "B");
  EXPECT_EQ(alerts[0].message(), "Host B is unreachable.");
  EXPECT_EQ(alerts[0].timestamp(), 1700000000);
}

TEST(ConnectivityMonitor, AllReachableMeansOk) {
  std::vector<std::string> probed;
  ConnectivityMonitor monitor({"A", "B", "C"},
                              std::make_unique<FakeProber>(std::set<std::string>{}, &probed));
  proto::SampleInfo sample;
  ASSERT_TRUE(monitor.update(&sample));
  EXPECT_EQ(sample.connectivity(), proto::CONNECTIVITY_OK);
  EXPECT_TRUE(connectivity_alerts(sample).empty());
}

TEST(ConnectivityMonitor, ProbesEveryHostInConfiguredOrder) {
  std::vector<std::string> probed;
  ConnectivityMonitor monitor(
      {"9.9.9.9", "1.1.1.1", "8.8.8.8"},
      std::make_unique<FakeProber>(std::set<std::string>{"9.9.9.9", "8.8.8.8"}, &probed));
  proto::SampleInfo sample;
  ASSERT_TRUE(monitor.update(&sample));
  EXPECT_EQ(probed, (std::vector<std::string>{"9.9.9.9", "1.1.1.1", "8.8.8.8"}));

  auto alerts = connectivity_alerts(sample);
  ASSERT_EQ(alerts.size(), 2u);
  EXPECT_EQ(alerts[0].host(), "9.9.9.9");
  EXPECT_EQ(alerts[1].host(), "8.8.8.8");
}

TEST(ConnectivityMonitor, RepeatedUpdateDoesNotAccumulateProbes) {
  std::vector<std::string> probed;
  ConnectivityMonitor monitor({"A"},
                              std::make_unique<FakeProber>(std::set<std::string>{}, &probed));
  proto::SampleInfo sample;
  ASSERT_TRUE(monitor.update(&sample));
  ASSERT_TRUE(monitor.update(&sample));
  EXPECT_EQ(sample.host_probes_size(), 1);
}

TEST(ConnectivityMonitor, DefaultIsFail) {
  std::vector<std::string> probed;
  ConnectivityMonitor monitor({"A"},
                              std::make_unique<FakeProber>(std::set<std::string>{}, &probed));
  proto::SampleInfo sample;
  monitor.apply_default(&sample);
  EXPECT_EQ(sample.connectivity(), proto::CONNECTIVITY_FAIL);
}

// ============================================================================
// PING PROBER
// ============================================================================

// 用 true / false 代替 ping，验证只看退出码
TEST(PingProber, ExitStatusZeroIsReachable) {
  PingProber prober(std::chrono::seconds(2), 1, "true");
  EXPECT_TRUE(prober.probe("127.0.0.1"));
}

TEST(PingProber, NonZeroExitIsUnreachable) {
  PingProber prober(std::chrono::seconds(2), 1, "false");
  EXPECT_FALSE(prober.probe("127.0.0.1"));
}

TEST(PingProber, MissingProgramIsUnreachable) {
  PingProber prober(std::chrono::seconds(2), 1, "hostwatch-no-such-ping");
  EXPECT_FALSE(prober.probe("127.0.0.1"));
}

// 主程序屏蔽了 SIGINT/SIGTERM，探测子进程不能继承该掩码
TEST(PingProber, ChildStartsWithEmptySignalMask) {
  hostwatch::test::TempDir dir;
  std::string script = dir.file("mask-check");
  hostwatch::test::write_file(
      script, "#!/bin/sh\ngrep -q '^SigBlk:[[:space:]]*0*$' /proc/$$/status\n");
  ASSERT_EQ(chmod(script.c_str(), 0755), 0);

  sigset_t blocked;
  sigset_t previous;
  sigemptyset(&blocked);
  sigaddset(&blocked, SIGINT);
  sigaddset(&blocked, SIGTERM);
  ASSERT_EQ(pthread_sigmask(SIG_BLOCK, &blocked, &previous), 0);

  PingProber prober(std::chrono::seconds(2), 1, script);
  bool reachable = prober.probe("127.0.0.1");

  pthread_sigmask(SIG_SETMASK, &previous, nullptr);
  EXPECT_TRUE(reachable);
}
