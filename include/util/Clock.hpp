#pragma once
#include <chrono>
#include <ctime>
#include <string>

namespace usbtrail::util {

// Local broken-down time (localtime_r).
[[nodiscard]] std::tm local_tm(std::chrono::system_clock::time_point tp);

// strftime over local time; fmt must produce fewer than 128 bytes.
[[nodiscard]] std::string format_local(std::chrono::system_clock::time_point tp, const char* fmt);

// "YYYY-MM-DD HH:MM:SS.mmm"
[[nodiscard]] std::string format_local_ms(std::chrono::system_clock::time_point tp);

} // namespace usbtrail::util
