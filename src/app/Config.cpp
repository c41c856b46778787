#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace usbtrail::app {

using usbtrail::model::ClockTime;
using usbtrail::model::DetectMode;
using usbtrail::model::Settings;
using usbtrail::util::LogLevel;
using usbtrail::util::TomlReader;

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("USBTRAIL_", 0) == 0) {
    alt = std::string("usbtrail_") + n.substr(9);
  } else if (n.rfind("usbtrail_", 0) == 0) {
    alt = std::string("USBTRAIL_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try {
    size_t used = 0;
    int out = std::stoi(v, &used);
    return used == std::string(v).size() ? out : defv;
  } catch (const std::logic_error&) {
    return defv;
  }
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/usbtrail/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/usbtrail/config.toml";
  return {};
}

std::optional<ClockTime> parse_clock_time(const std::string& text) {
  auto colon = text.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2) return std::nullopt;
  auto hh = text.substr(0, colon);
  auto mm = text.substr(colon + 1);
  if (mm.size() != 2) return std::nullopt;
  for (char c : hh + mm) if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  int h = std::stoi(hh);
  int m = std::stoi(mm);
  if (h > 23 || m > 59) return std::nullopt;
  return ClockTime{h, m};
}

std::string format_clock_time(const ClockTime& t) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", t.hour, t.minute);
  return buf;
}

std::optional<DetectMode> parse_detect_mode(const std::string& text) {
  if (text == "auto") return DetectMode::Auto;
  if (text == "uevent" || text == "native") return DetectMode::Uevent;
  if (text == "poll" || text == "polling") return DetectMode::Poll;
  return std::nullopt;
}

const char* to_string(DetectMode m) {
  switch (m) {
    case DetectMode::Auto:   return "auto";
    case DetectMode::Uevent: return "uevent";
    case DetectMode::Poll:   return "poll";
  }
  return "auto";
}

namespace {

// Resolve an int from TOML -> env -> compiled default. Values below min_value
// are reported and replaced by the default.
int resolve_int(const TomlReader& toml, bool have_toml, const char* section, const char* key,
                const char* env_name, int def, int min_value, usbtrail::util::Logger& log) {
  int v = def;
  if (have_toml && toml.has(section, key)) {
    v = toml.get_int(section, key, def);
  } else if (env_name) {
    v = getenv_int(env_name, def);
  }
  if (v < min_value) {
    log.logf(LogLevel::Warn, "config: %s.%s = %d is below %d; using %d", section, key, v, min_value, def);
    v = def;
  }
  return v;
}

bool resolve_bool(const TomlReader& toml, bool have_toml, const char* section, const char* key, bool def) {
  if (have_toml && toml.has(section, key)) return toml.get_bool(section, key, def);
  return def;
}

std::string resolve_string(const TomlReader& toml, bool have_toml, const char* section, const char* key,
                           const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key)) return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

std::vector<std::string> resolve_list(const TomlReader& toml, bool have_toml, const char* section,
                                      const char* key, const std::vector<std::string>& def,
                                      usbtrail::util::Logger& log) {
  if (!have_toml || !toml.has(section, key)) return def;
  auto v = toml.get_string_list(section, key);
  if (!v) {
    log.logf(LogLevel::Warn, "config: %s.%s is not an array of strings; using default", section, key);
    return def;
  }
  return *v;
}

ClockTime resolve_clock(const TomlReader& toml, bool have_toml, const char* section, const char* key,
                        ClockTime def, usbtrail::util::Logger& log) {
  if (!have_toml || !toml.has(section, key)) return def;
  auto text = toml.get_string(section, key);
  auto t = parse_clock_time(text);
  if (!t) {
    log.logf(LogLevel::Warn, "config: %s.%s = \"%s\" is not HH:MM; using %s", section, key, text.c_str(),
             format_clock_time(def).c_str());
    return def;
  }
  return *t;
}

} // namespace

Settings load_settings(const std::filesystem::path& path, usbtrail::util::Logger& log, bool* found) {
  Settings s{};
  const Settings d{};
  TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path.string());
  if (found) *found = have_toml;
  if (have_toml) log.logf(LogLevel::Debug, "config: loaded %s", path.c_str());

  // --- [general] ---
  s.general.log_directory    = resolve_string(toml, have_toml, "general", "log_directory", "USBTRAIL_LOG_DIR", d.general.log_directory);
  s.general.run_at_startup   = resolve_bool(toml, have_toml, "general", "run_at_startup", d.general.run_at_startup);
  s.general.minimize_to_tray = resolve_bool(toml, have_toml, "general", "minimize_to_tray", d.general.minimize_to_tray);
  if (s.general.log_directory.empty()) s.general.log_directory = d.general.log_directory;

  // --- [monitoring] ---
  s.monitoring.check_interval_seconds = resolve_int(toml, have_toml, "monitoring", "check_interval_seconds",
                                                    "USBTRAIL_POLL_INTERVAL", d.monitoring.check_interval_seconds, 1, log);
  s.monitoring.include_file_extensions = resolve_list(toml, have_toml, "monitoring", "include_file_extensions",
                                                      d.monitoring.include_file_extensions, log);
  s.monitoring.exclude_file_extensions = resolve_list(toml, have_toml, "monitoring", "exclude_file_extensions",
                                                      d.monitoring.exclude_file_extensions, log);
  if (have_toml && toml.has("monitoring", "min_file_size_bytes")) {
    auto v = toml.get_uint64("monitoring", "min_file_size_bytes");
    if (v) s.monitoring.min_file_size_bytes = *v;
    else log.warn("config: monitoring.min_file_size_bytes is not a non-negative integer; using 0");
  }
  if (have_toml && toml.has("monitoring", "max_file_size_bytes")) {
    auto v = toml.get_uint64("monitoring", "max_file_size_bytes");
    if (v) s.monitoring.max_file_size_bytes = *v;
    else log.warn("config: monitoring.max_file_size_bytes is not a non-negative integer; no upper bound");
  }

  // --- [alerts] ---
  s.alerts.enable_alerts = resolve_bool(toml, have_toml, "alerts", "enable_alerts", d.alerts.enable_alerts);
  s.alerts.alert_threshold_mb = resolve_int(toml, have_toml, "alerts", "alert_threshold_mb", nullptr,
                                            d.alerts.alert_threshold_mb, 0, log);
  s.alerts.suspicious_extensions = resolve_list(toml, have_toml, "alerts", "suspicious_extensions",
                                                d.alerts.suspicious_extensions, log);
  s.alerts.large_transfer_alert = resolve_bool(toml, have_toml, "alerts", "large_transfer_alert",
                                               d.alerts.large_transfer_alert);
  s.alerts.large_transfer_threshold_mb = resolve_int(toml, have_toml, "alerts", "large_transfer_threshold_mb", nullptr,
                                                     d.alerts.large_transfer_threshold_mb, 0, log);

  // --- [alerts.time_based_alerts] ---
  const char* tb = "alerts.time_based_alerts";
  auto& t = s.alerts.time_based_alerts;
  t.enabled        = resolve_bool(toml, have_toml, tb, "enabled", d.alerts.time_based_alerts.enabled);
  t.start          = resolve_clock(toml, have_toml, tb, "start", d.alerts.time_based_alerts.start, log);
  t.end            = resolve_clock(toml, have_toml, tb, "end", d.alerts.time_based_alerts.end, log);
  t.weekend_alerts = resolve_bool(toml, have_toml, tb, "weekend_alerts", d.alerts.time_based_alerts.weekend_alerts);

  // --- [security] ---
  s.security.hash_algorithm = resolve_string(toml, have_toml, "security", "hash_algorithm", nullptr,
                                             d.security.hash_algorithm);
  s.security.encrypt_logs = resolve_bool(toml, have_toml, "security", "encrypt_logs", d.security.encrypt_logs);
  s.security.log_retention_days = resolve_int(toml, have_toml, "security", "log_retention_days", nullptr,
                                              d.security.log_retention_days, 1, log);

  // --- [detect] --- (not part of the saved document unless changed)
  auto mode = resolve_string(toml, have_toml, "detect", "mode", "USBTRAIL_DETECT", to_string(d.detect_mode));
  if (auto m = parse_detect_mode(mode)) {
    s.detect_mode = *m;
  } else {
    log.logf(LogLevel::Warn, "config: unknown detect mode '%s'; using auto", mode.c_str());
  }
  return s;
}

bool save_settings(const Settings& s, const std::filesystem::path& path) {
  TomlReader toml;
  toml.set("general", "log_directory", s.general.log_directory);
  toml.set("general", "run_at_startup", s.general.run_at_startup);
  toml.set("general", "minimize_to_tray", s.general.minimize_to_tray);

  toml.set("monitoring", "check_interval_seconds", s.monitoring.check_interval_seconds);
  toml.set("monitoring", "include_file_extensions", s.monitoring.include_file_extensions);
  toml.set("monitoring", "exclude_file_extensions", s.monitoring.exclude_file_extensions);
  toml.set("monitoring", "min_file_size_bytes", s.monitoring.min_file_size_bytes);
  if (s.monitoring.max_file_size_bytes)
    toml.set("monitoring", "max_file_size_bytes", *s.monitoring.max_file_size_bytes);

  toml.set("alerts", "enable_alerts", s.alerts.enable_alerts);
  toml.set("alerts", "alert_threshold_mb", s.alerts.alert_threshold_mb);
  toml.set("alerts", "suspicious_extensions", s.alerts.suspicious_extensions);
  toml.set("alerts", "large_transfer_alert", s.alerts.large_transfer_alert);
  toml.set("alerts", "large_transfer_threshold_mb", s.alerts.large_transfer_threshold_mb);

  const auto& t = s.alerts.time_based_alerts;
  toml.set("alerts.time_based_alerts", "enabled", t.enabled);
  toml.set("alerts.time_based_alerts", "start", format_clock_time(t.start));
  toml.set("alerts.time_based_alerts", "end", format_clock_time(t.end));
  toml.set("alerts.time_based_alerts", "weekend_alerts", t.weekend_alerts);

  toml.set("security", "hash_algorithm", s.security.hash_algorithm);
  toml.set("security", "encrypt_logs", s.security.encrypt_logs);
  toml.set("security", "log_retention_days", s.security.log_retention_days);

  if (s.detect_mode != DetectMode::Auto) toml.set("detect", "mode", to_string(s.detect_mode));

  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  return toml.save(path.string());
}

} // namespace usbtrail::app
