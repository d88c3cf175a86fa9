#pragma once

#include <cstdint>
#include <string>

namespace hostwatch {

// 本地时间 "YYYY-MM-DD HH:MM:SS"，用于指标行与告警行
std::string format_timestamp(int64_t unix_seconds);

// date(1) 默认格式，如 "Mon Oct 19 20:04:00 UTC 2026"，用于启动横幅
std::string format_banner_date(int64_t unix_seconds);

}  // namespace hostwatch
