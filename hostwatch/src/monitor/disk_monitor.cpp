#include "monitor/disk_monitor.hpp"

#include <sys/statvfs.h>

#include <cerrno>
#include <cstring>

#include "fastlog/fastlog.hpp"
#include "util/log_name.hpp"

namespace hostwatch {

DiskMonitor::DiskMonitor(std::string mount_point)
    : _mount_point(std::move(mount_point)) {}

int DiskMonitor::usage_percent(uint64_t used_bytes, uint64_t avail_bytes) {
  uint64_t denominator = used_bytes + avail_bytes;
  if (denominator == 0) {
    return 0;
  }
  uint64_t percent = (used_bytes * 100 + denominator - 1) / denominator;
  return percent > 100 ? 100 : static_cast<int>(percent);
}

// 通过 statvfs 读取挂载点容量并更新到 sample_info 中
bool DiskMonitor::update(hostwatch::proto::SampleInfo* sample_info) {
  struct statvfs buf;
  if (statvfs(_mount_point.c_str(), &buf) != 0) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->warn("statvfs({}) failed: {}", _mount_point, strerror(errno));
    return false;
  }

  uint64_t frsize = buf.f_frsize ? buf.f_frsize : buf.f_bsize;
  uint64_t total = static_cast<uint64_t>(buf.f_blocks) * frsize;
  uint64_t used = static_cast<uint64_t>(buf.f_blocks - buf.f_bfree) * frsize;
  uint64_t avail = static_cast<uint64_t>(buf.f_bavail) * frsize;

  auto* disk = sample_info->mutable_disk();
  disk->set_mount_point(_mount_point);
  disk->set_total_bytes(total);
  disk->set_used_bytes(used);
  disk->set_avail_bytes(avail);
  sample_info->set_disk_usage_pct(usage_percent(used, avail));
  return true;
}

void DiskMonitor::apply_default(hostwatch::proto::SampleInfo* sample_info) {
  sample_info->clear_disk();
  sample_info->mutable_disk()->set_mount_point(_mount_point);
  sample_info->set_disk_usage_pct(0);
}

}  // namespace hostwatch
