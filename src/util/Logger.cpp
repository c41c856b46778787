#include "util/Logger.hpp"
#include "util/Clock.hpp"

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <thread>
#include <sstream>

namespace usbtrail::util {

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARNING";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

void Logger::logf(LogLevel level, const char* fmt, ...) {
  char buf[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  write(level, buf);
}

StreamLogger::StreamLogger(LogLevel min_level, std::filesystem::path log_dir)
    : min_level_(min_level), log_dir_(std::move(log_dir)) {
  if (log_dir_.empty()) return;
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "usbtrail: logger: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
    log_dir_.clear();
  }
}

StreamLogger::~StreamLogger() {
  std::lock_guard<std::mutex> lk(mu_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void StreamLogger::set_min_level(LogLevel level) {
  std::lock_guard<std::mutex> lk(mu_);
  min_level_ = level;
}

std::filesystem::path StreamLogger::day_path() const {
  return log_dir_ / ("app_" + format_local(std::chrono::system_clock::now(), "%Y-%m-%d") + ".log");
}

void StreamLogger::write(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lk(mu_);
  if (level < min_level_) return;
  std::fprintf(stderr, "usbtrail: %s: %s\n", level_name(level), message.c_str());

  if (log_dir_.empty()) return;
  // Rotate on day boundary
  auto required = day_path();
  if (required != current_path_) {
    if (file_.is_open()) file_.close();
    file_.open(required, std::ios::app);
    if (!file_) {
      std::fprintf(stderr, "usbtrail: logger: failed to open %s: %s\n",
                   required.c_str(), std::strerror(errno));
      current_path_.clear();
      return;
    }
    current_path_ = required;
  }
  std::ostringstream tid;
  tid << std::this_thread::get_id();
  file_ << format_local_ms(std::chrono::system_clock::now()) << " - " << level_name(level)
        << " - " << tid.str() << " - " << message << '\n';
  file_.flush();
}

} // namespace usbtrail::util
