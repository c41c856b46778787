#include "util/Clock.hpp"

#include <cstdio>

namespace usbtrail::util {

std::tm local_tm(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  return tm;
}

std::string format_local(std::chrono::system_clock::time_point tp, const char* fmt) {
  std::tm tm = local_tm(tp);
  char buf[128];
  size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

std::string format_local_ms(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  char tail[8];
  std::snprintf(tail, sizeof(tail), ".%03d", static_cast<int>(ms));
  return format_local(tp, "%Y-%m-%d %H:%M:%S") + tail;
}

} // namespace usbtrail::util
