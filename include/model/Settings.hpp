#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace usbtrail::model {

struct GeneralSettings {
  std::string log_directory{"logs"};
  bool run_at_startup{true};
  bool minimize_to_tray{true};
};

struct MonitoringSettings {
  int check_interval_seconds{1};
  std::vector<std::string> include_file_extensions{"*"};
  std::vector<std::string> exclude_file_extensions{".tmp", ".temp", ".lock"};
  uint64_t min_file_size_bytes{0};
  std::optional<uint64_t> max_file_size_bytes{};
};

// Hours only are significant; minutes are parsed and kept for round-trips.
struct ClockTime {
  int hour{0};
  int minute{0};
};

struct TimeBasedAlertSettings {
  bool enabled{true};
  ClockTime start{18, 0};
  ClockTime end{7, 0};
  bool weekend_alerts{true};
};

struct AlertSettings {
  bool enable_alerts{true};
  int alert_threshold_mb{100};
  std::vector<std::string> suspicious_extensions{
    ".zip", ".rar", ".7z", ".tar", ".gz", ".db", ".sql", ".xlsx", ".docx", ".pdf"};
  bool large_transfer_alert{true};
  int large_transfer_threshold_mb{500};
  TimeBasedAlertSettings time_based_alerts{};
};

struct SecuritySettings {
  std::string hash_algorithm{"sha256"};
  bool encrypt_logs{false};
  int log_retention_days{90};
};

enum class DetectMode { Auto, Uevent, Poll };

struct Settings {
  GeneralSettings general{};
  MonitoringSettings monitoring{};
  AlertSettings alerts{};
  SecuritySettings security{};
  DetectMode detect_mode{DetectMode::Auto};
};

} // namespace usbtrail::model
