#include "monitor/host_prober.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include "fastlog/fastlog.hpp"
#include "util/log_name.hpp"

extern char** environ;

namespace hostwatch {

PingProber::PingProber(std::chrono::seconds timeout, int attempts,
                       std::string ping_program)
    : _timeout(timeout),
      _attempts(attempts),
      _ping_program(std::move(ping_program)) {}

bool PingProber::probe(const std::string& host) {
  std::string count = std::to_string(_attempts);
  std::string wait = std::to_string(_timeout.count());
  std::vector<char*> argv = {
      const_cast<char*>(_ping_program.c_str()),
      const_cast<char*>("-c"), const_cast<char*>(count.c_str()),
      const_cast<char*>("-W"), const_cast<char*>(wait.c_str()),
      const_cast<char*>(host.c_str()), nullptr};

  // 标准输出与标准错误重定向到 /dev/null
  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null",
                                   O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null",
                                   O_WRONLY, 0);

  // 主线程屏蔽了 SIGINT/SIGTERM，子进程恢复为空信号掩码与默认处理
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  posix_spawnattr_setsigmask(&attr, &empty_mask);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGTERM);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, _ping_program.c_str(), &actions, &attr,
                        argv.data(), environ);
  posix_spawnattr_destroy(&attr);
  posix_spawn_file_actions_destroy(&actions);
  if (rc != 0) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->error("Failed to launch {}: {}", _ping_program, strerror(rc));
    return false;
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
      if (log) log->error("waitpid for {} failed: {}", _ping_program, strerror(errno));
      return false;
    }
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}  // namespace hostwatch
