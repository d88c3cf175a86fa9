#pragma once

#include <cstdint>
#include <string>

#include "sample_info.pb.h"

namespace hostwatch {

// "YYYY-MM-DD HH:MM:SS | CPU: N% | Disk: N% | Mem: N% | Net: N KB/s | Connectivity: OK"
std::string format_metrics_line(const hostwatch::proto::SampleInfo& sample);

// "[YYYY-MM-DD HH:MM:SS] CPU ALERT: Usage is 81%, exceeding threshold of 80%."
std::string format_alert_line(const hostwatch::proto::AlertInfo& alert);

// 标题行、列标题、进程行、结束行，最后以空行分隔
std::string format_spike_block(const hostwatch::proto::CpuSpikeReport& report);

// "--- Monitor started at Mon Oct 19 20:04:00 UTC 2026 ---"
std::string format_banner(int64_t unix_seconds);

}  // namespace hostwatch
