#pragma once
#include "model/Settings.hpp"

#include <ctime>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace usbtrail::app {

// Pure predicates over path, size, extension and wall-clock time. Holds a
// copy of the policy; safe to share between reconcilers.
class PolicyEvaluator {
public:
  explicit PolicyEvaluator(usbtrail::model::Settings settings);

  // Regular file, inside the size bounds and passing the extension rule.
  // A size that cannot be read does not exclude the file.
  [[nodiscard]] bool is_monitor_eligible(const std::filesystem::path& path) const;

  [[nodiscard]] bool extension_allowed(const std::string& ext) const;
  [[nodiscard]] bool size_allowed(uint64_t size) const;

  // Suspicious extension and larger than alert_threshold_mb. An unknown size
  // counts as suspicious when the extension matches.
  [[nodiscard]] bool is_suspicious(const std::filesystem::path& path, std::optional<uint64_t> size) const;

  [[nodiscard]] bool is_large_transfer(uint64_t size) const;

  // Weekend (when enabled) or the hour falls in [start, end), wrapping midnight.
  [[nodiscard]] bool is_restricted_time(const std::tm& local) const;

  [[nodiscard]] bool alerts_enabled() const { return settings_.alerts.enable_alerts; }
  [[nodiscard]] const usbtrail::model::Settings& settings() const { return settings_; }

private:
  usbtrail::model::Settings settings_;
};

// Lowercase extension including the leading dot ("" when there is none).
[[nodiscard]] std::string lower_extension(const std::filesystem::path& path);

// Bytes to mebibytes as a double, for threshold comparisons and messages.
[[nodiscard]] inline double to_mb(uint64_t bytes) { return static_cast<double>(bytes) / (1024.0 * 1024.0); }

} // namespace usbtrail::app
