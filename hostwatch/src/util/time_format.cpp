#include "util/time_format.hpp"

#include <ctime>

namespace hostwatch {

static std::string format_local(int64_t unix_seconds, const char* layout) {
  std::time_t t = static_cast<std::time_t>(unix_seconds);
  struct tm local_tm;
  if (localtime_r(&t, &local_tm) == nullptr) {
    return std::to_string(unix_seconds);
  }
  char buf[64];
  size_t n = std::strftime(buf, sizeof(buf), layout, &local_tm);
  return std::string(buf, n);
}

std::string format_timestamp(int64_t unix_seconds) {
  return format_local(unix_seconds, "%Y-%m-%d %H:%M:%S");
}

std::string format_banner_date(int64_t unix_seconds) {
  return format_local(unix_seconds, "%a %b %e %H:%M:%S %Z %Y");
}

}  // namespace hostwatch
