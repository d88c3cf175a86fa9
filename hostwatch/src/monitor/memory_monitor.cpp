#include "monitor/memory_monitor.hpp"

#include <algorithm>
#include <vector>

#include "fastlog/fastlog.hpp"
#include "util/log_name.hpp"
#include "util/readfile.hpp"

namespace hostwatch {

MemoryMonitor::MemoryMonitor(std::string meminfo_path)
    : _meminfo_path(std::move(meminfo_path)) {}

bool MemoryMonitor::read_mem_info(const std::string &meminfo_path,
                                  MemInfo *info) {
  ReadFile meminfo_file(meminfo_path);
  if (!meminfo_file.is_open()) {
    return false;
  }
  std::vector<std::string> fields;
  // 每行格式: "MemTotal:       16333064 kB"
  while (meminfo_file.read_line(&fields)) {
    if (fields.size() < 2) {
      continue;
    }
    int64_t value = 0;
    try {
      value = std::stoll(fields[1]);
    } catch (const std::exception &) {
      continue;
    }
    const std::string &key = fields[0];
    if (key == "MemTotal:") {
      info->total = value;
    } else if (key == "MemFree:") {
      info->free = value;
    } else if (key == "MemAvailable:") {
      info->avail = value;
    } else if (key == "Buffers:") {
      info->buffers = value;
    } else if (key == "Cached:") {
      info->cached = value;
    } else if (key == "SReclaimable:") {
      info->sReclaimable = value;
    }
  }
  return info->total > 0 && (info->avail >= 0 || info->free >= 0);
}

int64_t MemoryMonitor::used_kb(const MemInfo &info) {
  int64_t used = 0;
  if (info.avail >= 0) {
    used = info.total - info.avail;
  } else {
    used = info.total - info.free - info.buffers - info.cached -
           info.sReclaimable;
  }
  return std::clamp<int64_t>(used, 0, info.total);
}

int MemoryMonitor::usage_percent(const MemInfo &info) {
  if (info.total <= 0) {
    return 0;
  }
  int64_t percent = used_kb(info) * 100 / info.total;
  return static_cast<int>(std::clamp<int64_t>(percent, 0, 100));
}

// 从 /proc/meminfo 读取内存信息并更新到 sample_info 中
bool MemoryMonitor::update(hostwatch::proto::SampleInfo *sample_info) {
  MemInfo info;
  if (!read_mem_info(_meminfo_path, &info)) {
    auto *log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->warn("Failed to parse memory totals from {}", _meminfo_path);
    return false;
  }

  auto *mem_msg = sample_info->mutable_mem();
  mem_msg->set_total_kb(static_cast<uint64_t>(info.total));
  mem_msg->set_available_kb(
      static_cast<uint64_t>(std::max<int64_t>(info.total - used_kb(info), 0)));
  mem_msg->set_used_kb(static_cast<uint64_t>(used_kb(info)));
  sample_info->set_mem_usage_pct(usage_percent(info));
  return true;
}

void MemoryMonitor::apply_default(hostwatch::proto::SampleInfo *sample_info) {
  sample_info->clear_mem();
  sample_info->set_mem_usage_pct(0);
}

} // namespace hostwatch
