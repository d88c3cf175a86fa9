#pragma once

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "sample_info.pb.h"

namespace hostwatch {

// 进程快照来源，用于 CPU 峰值时的诊断
class ProcessSource {
 public:
  virtual ~ProcessSource() {}
  // 按 CPU 占用降序返回至多 limit 个进程
  virtual std::vector<hostwatch::proto::ProcessInfo> top_by_cpu(size_t limit) = 0;
};

/**
 * 基于 /proc 的进程快照
 *
 * CPU 占用与 ps 的 %CPU 口径一致：进程累计 CPU 时间 / 进程存活时间，
 * 占用相同时按 PID 升序。读取过程中退出的进程直接跳过。
 */
class ProcProcessSource : public ProcessSource {
 public:
  struct ProcStat {
    std::string comm;
    char state = '?';
    uint64_t utime = 0;
    uint64_t stime = 0;
    uint64_t start_time = 0;  // 开机后的时钟滴答数
    int64_t rss_pages = 0;
  };

  explicit ProcProcessSource(std::string proc_root = "/proc",
                             std::string passwd_path = "/etc/passwd");

  std::vector<hostwatch::proto::ProcessInfo> top_by_cpu(size_t limit) override;

  // 解析 /proc/<pid>/stat 的内容，comm 中可能含有空格和括号
  static bool parse_stat(const std::string& content, ProcStat* stat);
  static double cpu_percent(uint64_t cpu_ticks, uint64_t start_ticks,
                            double uptime_seconds, long ticks_per_second);

 private:
  /**
   * 根据 UID 从 passwd 文件中查找用户名
   *
   * @param uid 用户ID
   * @return 用户名，未找到时返回 UID 的十进制字符串
   */
  std::string get_username_by_uid(uid_t uid);
  bool read_uptime(double* uptime_seconds);
  int64_t read_mem_total_kb();
  bool read_process(pid_t pid, double uptime_seconds, int64_t mem_total_kb,
                    hostwatch::proto::ProcessInfo* info);

  std::string _proc_root;
  std::string _passwd_path;
  long _ticks_per_second;
  long _page_size_kb;
  std::unordered_map<uid_t, std::string> _user_cache;
};

}  // namespace hostwatch
