#pragma once

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "fastlog/fastlog.hpp"
#include "util/log_name.hpp"

namespace hostwatch {
// 读取文件类，逐行读取并按空白分割
class ReadFile {
public:
  explicit ReadFile(const std::string &name) : _name(name), _file_stream(name) {
    if (!_file_stream.is_open()) {
      auto *log = fastlog::file::get_logger(kHostwatchLoggerName);
      if (log) log->debug("ReadFile: failed to open {}", _name);
    }
  }

  ~ReadFile() {
    if (_file_stream.is_open())
      _file_stream.close();
  }

  bool is_open() const { return _file_stream.is_open(); }

  // 读取一行并将其分割成单词存储在args中，args 会先被清空
  bool read_line(std::vector<std::string> *args) {
    args->clear();
    std::string line;
    if (!std::getline(_file_stream, line)) {
      return false;
    }
    std::istringstream line_stream(line);
    std::string word;
    while (line_stream >> word) {
      args->push_back(word);
    }
    return true;
  }

  // 读取整个文件内容
  bool read_all(std::string *content) {
    if (!_file_stream.is_open()) {
      return false;
    }
    std::ostringstream buffer;
    buffer << _file_stream.rdbuf();
    *content = buffer.str();
    return true;
  }

private:
  std::string _name;
  std::ifstream _file_stream;
};

} // namespace hostwatch
