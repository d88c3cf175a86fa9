#pragma once

namespace hostwatch {

// 运行日志器名称：main 中创建，其余模块按名称获取（未创建时为 nullptr）
inline constexpr char kHostwatchLoggerName[] = "hostwatch_file_logger";

}  // namespace hostwatch
