#include "app/PolicyEvaluator.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>

namespace fs = std::filesystem;

namespace usbtrail::app {

namespace {

std::string lowered(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Suffix match or shell glob ("*.doc?" and friends)
bool pattern_matches(const std::string& ext, const std::string& pattern) {
  auto p = lowered(pattern);
  if (ends_with(ext, p)) return true;
  return ::fnmatch(p.c_str(), ext.c_str(), 0) == 0;
}

bool contains_ext(const std::vector<std::string>& list, const std::string& ext) {
  return std::any_of(list.begin(), list.end(), [&](const std::string& e){ return lowered(e) == ext; });
}

} // namespace

std::string lower_extension(const fs::path& path) {
  return lowered(path.extension().string());
}

PolicyEvaluator::PolicyEvaluator(usbtrail::model::Settings settings) : settings_(std::move(settings)) {}

bool PolicyEvaluator::extension_allowed(const std::string& ext) const {
  const auto& inc = settings_.monitoring.include_file_extensions;
  const auto& exc = settings_.monitoring.exclude_file_extensions;
  if (inc.size() == 1 && inc[0] == "*") return !contains_ext(exc, ext);

  bool included = std::any_of(inc.begin(), inc.end(), [&](const std::string& p){ return pattern_matches(ext, p); });
  if (!included) return false;
  return std::none_of(exc.begin(), exc.end(), [&](const std::string& p){ return pattern_matches(ext, p); });
}

bool PolicyEvaluator::size_allowed(uint64_t size) const {
  const auto& m = settings_.monitoring;
  if (m.min_file_size_bytes > 0 && size < m.min_file_size_bytes) return false;
  if (m.max_file_size_bytes && size > *m.max_file_size_bytes) return false;
  return true;
}

bool PolicyEvaluator::is_monitor_eligible(const fs::path& path) const {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return false;
  auto size = fs::file_size(path, ec);
  if (!ec && !size_allowed(size)) return false;
  return extension_allowed(lower_extension(path));
}

bool PolicyEvaluator::is_suspicious(const fs::path& path, std::optional<uint64_t> size) const {
  if (!contains_ext(settings_.alerts.suspicious_extensions, lower_extension(path))) return false;
  if (!size) return true;
  return to_mb(*size) > static_cast<double>(settings_.alerts.alert_threshold_mb);
}

bool PolicyEvaluator::is_large_transfer(uint64_t size) const {
  if (!settings_.alerts.large_transfer_alert) return false;
  return to_mb(size) > static_cast<double>(settings_.alerts.large_transfer_threshold_mb);
}

bool PolicyEvaluator::is_restricted_time(const std::tm& local) const {
  const auto& t = settings_.alerts.time_based_alerts;
  if (!t.enabled) return false;
  bool weekend = local.tm_wday == 0 || local.tm_wday == 6;
  if (weekend && t.weekend_alerts) return true;
  int h = local.tm_hour;
  int start = t.start.hour;
  int end = t.end.hour;
  if (start == end) return false;
  if (start < end) return h >= start && h < end;
  return h >= start || h < end;
}

} // namespace usbtrail::app
