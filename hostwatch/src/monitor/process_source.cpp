#include "monitor/process_source.hpp"

#include <dirent.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include "fastlog/fastlog.hpp"
#include "monitor/memory_monitor.hpp"
#include "util/log_name.hpp"
#include "util/readfile.hpp"

namespace hostwatch {

ProcProcessSource::ProcProcessSource(std::string proc_root,
                                     std::string passwd_path)
    : _proc_root(std::move(proc_root)),
      _passwd_path(std::move(passwd_path)),
      _ticks_per_second(sysconf(_SC_CLK_TCK)),
      _page_size_kb(sysconf(_SC_PAGESIZE) / 1024) {
  if (_ticks_per_second <= 0) _ticks_per_second = 100;
  if (_page_size_kb <= 0) _page_size_kb = 4;
}

bool ProcProcessSource::parse_stat(const std::string& content, ProcStat* stat) {
  // 格式: "pid (comm) state ppid ..."，comm 以最后一个 ')' 为界
  auto lp = content.find('(');
  auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp ||
      rp + 2 > content.size()) {
    return false;
  }
  stat->comm = content.substr(lp + 1, rp - lp - 1);

  std::istringstream iss(content.substr(rp + 2));
  std::string skip;
  iss >> stat->state;
  // ppid 到 cmajflt 共 10 个字段
  for (int i = 0; i < 10; ++i) iss >> skip;
  iss >> stat->utime >> stat->stime;
  // cutime 到 itrealvalue 共 6 个字段
  for (int i = 0; i < 6; ++i) iss >> skip;
  iss >> stat->start_time;
  uint64_t vsize = 0;
  iss >> vsize >> stat->rss_pages;
  return !iss.fail();
}

double ProcProcessSource::cpu_percent(uint64_t cpu_ticks, uint64_t start_ticks,
                                      double uptime_seconds,
                                      long ticks_per_second) {
  if (ticks_per_second <= 0) {
    return 0;
  }
  double elapsed = uptime_seconds -
                   static_cast<double>(start_ticks) / ticks_per_second;
  if (elapsed <= 0) {
    return 0;
  }
  double cpu_seconds = static_cast<double>(cpu_ticks) / ticks_per_second;
  return cpu_seconds / elapsed * 100.0;
}

std::string ProcProcessSource::get_username_by_uid(uid_t uid) {
  auto cached = _user_cache.find(uid);
  if (cached != _user_cache.end()) {
    return cached->second;
  }

  std::string result = std::to_string(uid);
  std::ifstream passwd_file(_passwd_path);
  std::string line;
  while (passwd_file.is_open() && std::getline(passwd_file, line)) {
    // passwd 格式: username:password:uid:gid:gecos:home:shell
    std::istringstream iss(line);
    std::string username, password, uid_str;
    if (!std::getline(iss, username, ':') ||
        !std::getline(iss, password, ':') ||
        !std::getline(iss, uid_str, ':')) {
      continue;
    }
    try {
      if (static_cast<uid_t>(std::stoul(uid_str)) == uid) {
        result = username;
        break;
      }
    } catch (const std::exception&) {
      continue;
    }
  }

  _user_cache.emplace(uid, result);
  return result;
}

bool ProcProcessSource::read_uptime(double* uptime_seconds) {
  std::ifstream uptime_file(_proc_root + "/uptime");
  return static_cast<bool>(uptime_file >> *uptime_seconds);
}

int64_t ProcProcessSource::read_mem_total_kb() {
  MemoryMonitor::MemInfo info;
  MemoryMonitor::read_mem_info(_proc_root + "/meminfo", &info);
  return info.total;
}

bool ProcProcessSource::read_process(pid_t pid, double uptime_seconds,
                                     int64_t mem_total_kb,
                                     hostwatch::proto::ProcessInfo* info) {
  std::string base = _proc_root + "/" + std::to_string(pid);

  std::string content;
  ReadFile stat_file(base + "/stat");
  if (!stat_file.read_all(&content)) {
    return false;
  }
  ProcStat stat;
  if (!parse_stat(content, &stat)) {
    return false;
  }

  // Uid 行: "Uid: real effective saved fs"，取有效 UID
  uid_t uid = 0;
  bool uid_found = false;
  ReadFile status_file(base + "/status");
  std::vector<std::string> fields;
  while (status_file.read_line(&fields)) {
    if (fields.size() >= 3 && fields[0] == "Uid:") {
      try {
        uid = static_cast<uid_t>(std::stoul(fields[2]));
        uid_found = true;
      } catch (const std::exception&) {
        uid_found = false;
      }
      break;
    }
  }

  // 命令行参数以 '\0' 分隔，内核线程为空，用 [comm] 表示
  std::string cmdline;
  ReadFile cmdline_file(base + "/cmdline");
  cmdline_file.read_all(&cmdline);
  while (!cmdline.empty() && cmdline.back() == '\0') cmdline.pop_back();
  std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
  if (cmdline.empty()) {
    cmdline = "[" + stat.comm + "]";
  }

  uint64_t rss_kb = stat.rss_pages > 0
                        ? static_cast<uint64_t>(stat.rss_pages) * _page_size_kb
                        : 0;
  info->set_pid(static_cast<int32_t>(pid));
  info->set_user(uid_found ? get_username_by_uid(uid) : "?");
  info->set_cpu_percent(cpu_percent(stat.utime + stat.stime, stat.start_time,
                                    uptime_seconds, _ticks_per_second));
  info->set_mem_percent(mem_total_kb > 0
                            ? static_cast<double>(rss_kb) * 100.0 / mem_total_kb
                            : 0.0);
  info->set_rss_kb(rss_kb);
  info->set_command(cmdline);
  return true;
}

std::vector<hostwatch::proto::ProcessInfo> ProcProcessSource::top_by_cpu(
    size_t limit) {
  std::vector<hostwatch::proto::ProcessInfo> processes;

  double uptime_seconds = 0;
  if (!read_uptime(&uptime_seconds)) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->error("Failed to read {}/uptime", _proc_root);
    return processes;
  }
  int64_t mem_total_kb = read_mem_total_kb();

  DIR* dir = opendir(_proc_root.c_str());
  if (dir == nullptr) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->error("Failed to open {}", _proc_root);
    return processes;
  }
  struct dirent* entry = nullptr;
  while ((entry = readdir(dir)) != nullptr) {
    std::string name(entry->d_name);
    if (name.empty() ||
        !std::all_of(name.begin(), name.end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; })) {
      continue;
    }
    hostwatch::proto::ProcessInfo info;
    // 进程可能在遍历期间退出
    if (read_process(static_cast<pid_t>(std::stol(name)), uptime_seconds,
                     mem_total_kb, &info)) {
      processes.push_back(std::move(info));
    }
  }
  closedir(dir);

  std::sort(processes.begin(), processes.end(),
            [](const hostwatch::proto::ProcessInfo& a,
               const hostwatch::proto::ProcessInfo& b) {
              if (a.cpu_percent() != b.cpu_percent()) {
                return a.cpu_percent() > b.cpu_percent();
              }
              return a.pid() < b.pid();
            });
  if (processes.size() > limit) {
    processes.resize(limit);
  }
  return processes;
}

}  // namespace hostwatch
