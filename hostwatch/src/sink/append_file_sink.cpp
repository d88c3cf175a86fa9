#include "sink/log_sink.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "fastlog/fastlog.hpp"
#include "util/log_name.hpp"

namespace hostwatch {

AppendFileSink::AppendFileSink(std::string path, size_t max_pending)
    : _path(std::move(path)), _max_pending(max_pending) {}

bool AppendFileSink::write_record(const std::string& record) {
  int fd = ::open(_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->error("Failed to open {}: {}", _path, strerror(errno));
    return false;
  }

  ssize_t written = 0;
  do {
    written = ::write(fd, record.data(), record.size());
  } while (written < 0 && errno == EINTR);
  int write_errno = errno;
  ::close(fd);

  if (written < 0) {
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->error("Failed to append to {}: {}", _path, strerror(write_errno));
    return false;
  }
  if (static_cast<size_t>(written) != record.size()) {
    // 短写（如磁盘写满），剩余部分作为新记录重试会破坏行边界，只记录错误
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->error("Short write to {}: {} of {} bytes", _path, written, record.size());
  }
  return true;
}

bool AppendFileSink::flush_pending() {
  while (!_pending.empty()) {
    if (!write_record(_pending.front())) {
      return false;
    }
    _pending.pop_front();
  }
  return true;
}

bool AppendFileSink::append(const std::string& record) {
  // 保证顺序：待写队列未清空前，新记录只能排队
  if (flush_pending() && write_record(record)) {
    return true;
  }

  _pending.push_back(record);
  if (_pending.size() > _max_pending) {
    _pending.pop_front();
    auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
    if (log) log->warn("Pending queue for {} full, dropped oldest record", _path);
  }
  return false;
}

}  // namespace hostwatch
