#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace usbtrail::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

[[nodiscard]] const char* level_name(LogLevel level);

// Leveled logging capability handed to every component at construction.
// Implementations must be safe to call from any thread.
class Logger {
public:
  virtual ~Logger() = default;

  virtual void write(LogLevel level, const std::string& message) = 0;

  void debug(const std::string& m) { write(LogLevel::Debug, m); }
  void info(const std::string& m)  { write(LogLevel::Info, m); }
  void warn(const std::string& m)  { write(LogLevel::Warn, m); }
  void error(const std::string& m) { write(LogLevel::Error, m); }

  // printf-style convenience; messages longer than 1KiB are truncated.
  void logf(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
};

// stderr sink with an optional daily app_YYYY-MM-DD.log mirror.
class StreamLogger : public Logger {
public:
  explicit StreamLogger(LogLevel min_level = LogLevel::Info, std::filesystem::path log_dir = {});
  ~StreamLogger() override;
  StreamLogger(const StreamLogger&) = delete;
  StreamLogger& operator=(const StreamLogger&) = delete;

  void write(LogLevel level, const std::string& message) override;

  void set_min_level(LogLevel level);

private:
  [[nodiscard]] std::filesystem::path day_path() const;

  std::mutex mu_;
  LogLevel min_level_;
  std::filesystem::path log_dir_;
  std::filesystem::path current_path_;
  std::ofstream file_;
};

} // namespace usbtrail::util
