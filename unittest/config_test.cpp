// ============================================================================
// CONFIG UNIT TESTS
// ============================================================================
// Command line parsing, defaults and fail-fast validation
// ============================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "config/config.hpp"

using namespace hostwatch;

namespace {

Config parse(std::vector<std::string> args) {
  args.insert(args.begin(), "hostwatch");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return parse_config(static_cast<int>(args.size()), argv.data());
}

}  // namespace

// ============================================================================
// DEFAULTS
// ============================================================================

TEST(Config, DefaultsMatchOriginalMonitor) {
  Config config = parse({});
  EXPECT_EQ(config.cpu_threshold, 80);
  EXPECT_EQ(config.disk_threshold, 60);
  EXPECT_EQ(config.mem_threshold, 80);
  EXPECT_EQ(config.net_threshold, 102400);
  EXPECT_EQ(config.interval.count(), 60);
  EXPECT_EQ(config.interface, "eth0");
  ASSERT_EQ(config.hosts.size(), 4u);
  EXPECT_EQ(config.hosts[0], "8.8.8.8");
  EXPECT_EQ(config.hosts[3], "9.9.9.9");
  EXPECT_EQ(config.metrics_log, "system_load.log");
  EXPECT_EQ(config.alert_log, "alerts.log");
  EXPECT_EQ(config.spike_log, "cpu_spike_details.log");
  EXPECT_EQ(config.sample_window.count(), 1000);
  EXPECT_EQ(config.probe_timeout.count(), 2);
  EXPECT_EQ(config.alert_cooldown.count(), 0);
  EXPECT_FALSE(config.verbose);
  EXPECT_FALSE(config.show_help);
}

// ============================================================================
// PARSING
// ============================================================================

TEST(Config, ParsesSeparateAndInlineValues) {
  Config config = parse({"--cpu-threshold", "90", "--disk-threshold=70",
                         "--net-threshold", "2048", "--interval=5",
                         "--interface", "wlan0", "--verbose"});
  EXPECT_EQ(config.cpu_threshold, 90);
  EXPECT_EQ(config.disk_threshold, 70);
  EXPECT_EQ(config.net_threshold, 2048);
  EXPECT_EQ(config.interval.count(), 5);
  EXPECT_EQ(config.interface, "wlan0");
  EXPECT_TRUE(config.verbose);
}

TEST(Config, ParsesHostListInOrder) {
  Config config = parse({"--hosts", "10.0.0.1,example.com,192.168.1.1"});
  ASSERT_EQ(config.hosts.size(), 3u);
  EXPECT_EQ(config.hosts[0], "10.0.0.1");
  EXPECT_EQ(config.hosts[1], "example.com");
  EXPECT_EQ(config.hosts[2], "192.168.1.1");
}

TEST(Config, HelpFlag) {
  EXPECT_TRUE(parse({"--help"}).show_help);
  EXPECT_NE(usage("hostwatch").find("--cpu-threshold"), std::string::npos);
}

// ============================================================================
// ERROR HANDLING
// ============================================================================

TEST(Config, ThrowsOnUnknownOption) {
  EXPECT_THROW(parse({"--cpu", "80"}), ConfigError);
  EXPECT_THROW(parse({"positional"}), ConfigError);
}

TEST(Config, ThrowsOnMissingValue) {
  EXPECT_THROW(parse({"--interface"}), ConfigError);
}

TEST(Config, ThrowsOnNonNumericValue) {
  EXPECT_THROW(parse({"--cpu-threshold", "high"}), ConfigError);
  EXPECT_THROW(parse({"--interval", "10s"}), ConfigError);
}

TEST(Config, ThrowsOnOutOfRangeThreshold) {
  EXPECT_THROW(parse({"--cpu-threshold", "101"}), ConfigError);
  EXPECT_THROW(parse({"--mem-threshold", "-1"}), ConfigError);
  EXPECT_THROW(parse({"--net-threshold", "-5"}), ConfigError);
  EXPECT_NO_THROW(parse({"--disk-threshold", "100"}));
}

TEST(Config, ThrowsOnInvalidInterval) {
  EXPECT_THROW(parse({"--interval", "0"}), ConfigError);
  EXPECT_THROW(parse({"--sample-window", "0"}), ConfigError);
  EXPECT_THROW(parse({"--probe-timeout", "0"}), ConfigError);
}

TEST(Config, ThrowsInsteadOfWrappingHugeThreshold) {
  // 4294967376 = 2^32 + 80，收窄为 int 后会变成 80
  EXPECT_THROW(parse({"--cpu-threshold", "4294967376"}), ConfigError);
  EXPECT_THROW(parse({"--disk-threshold=4294967356"}), ConfigError);
  EXPECT_THROW(parse({"--mem-threshold", "-4294967216"}), ConfigError);
  EXPECT_THROW(parse({"--net-threshold", "99999999999999999999"}), ConfigError);
}

TEST(Config, ThrowsOnDurationAboveOneDay) {
  EXPECT_THROW(parse({"--interval", "100000000000"}), ConfigError);
  EXPECT_THROW(parse({"--interval", "86401"}), ConfigError);
  EXPECT_THROW(parse({"--probe-timeout", "86401"}), ConfigError);
  EXPECT_THROW(parse({"--alert-cooldown", "100000000000"}), ConfigError);
  EXPECT_THROW(parse({"--alert-cooldown", "-1"}), ConfigError);
  EXPECT_NO_THROW(parse({"--interval", "86400"}));
  EXPECT_NO_THROW(parse({"--alert-cooldown", "86400"}));
}

TEST(Config, ThrowsOnInvalidInterface) {
  EXPECT_THROW(parse({"--interface="}), ConfigError);
  EXPECT_THROW(parse({"--interface", "an-interface-name-that-is-too-long"}),
               ConfigError);
}

TEST(Config, ThrowsOnInvalidHosts) {
  EXPECT_THROW(parse({"--hosts="}), ConfigError);
  EXPECT_THROW(parse({"--hosts", "8.8.8.8,,1.1.1.1"}), ConfigError);
  EXPECT_THROW(parse({"--hosts", "8.8.8.8,"}), ConfigError);
  EXPECT_THROW(parse({"--hosts", "-f"}), ConfigError);
}

TEST(Config, ValidateRejectsHandBuiltConfig) {
  Config config;
  config.hosts.clear();
  EXPECT_THROW(validate_config(config), ConfigError);
}
