#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace hostwatch {

// 只追加的记录输出
class LogSink {
 public:
  virtual ~LogSink() {}
  // 追加一条完整记录（含换行），全部写入成功返回 true
  virtual bool append(const std::string& record) = 0;
  // 重试之前写入失败的记录，没有待写记录时返回 true
  virtual bool flush_pending() { return true; }
};

/**
 * 追加写文件
 *
 * 每次写入都以 O_APPEND 打开文件，一条记录只调用一次 write(2)，
 * 外部 tail 进程不会读到半行。写入失败的记录进入待写队列，
 * 下次 append 或 flush_pending 时按顺序重试；队列超过上限时丢弃最旧的记录。
 */
class AppendFileSink : public LogSink {
 public:
  static constexpr size_t kDefaultMaxPending = 1024;

  explicit AppendFileSink(std::string path,
                          size_t max_pending = kDefaultMaxPending);

  bool append(const std::string& record) override;
  bool flush_pending() override;

  size_t pending() const { return _pending.size(); }
  const std::string& path() const { return _path; }

 private:
  bool write_record(const std::string& record);

  std::string _path;
  size_t _max_pending;
  std::deque<std::string> _pending;
};

}  // namespace hostwatch
