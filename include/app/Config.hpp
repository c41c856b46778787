#pragma once

#include "model/Settings.hpp"
#include "util/Logger.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace usbtrail::app {

// $XDG_CONFIG_HOME/usbtrail/config.toml, else ~/.config/usbtrail/config.toml.
// Empty when neither variable is set.
std::string config_file_path();

// Load policy from a TOML file. Each value resolves TOML -> environment ->
// compiled default. A missing or unreadable file yields defaults (plus any
// environment overrides); found, when given, reports whether it was read.
usbtrail::model::Settings load_settings(const std::filesystem::path& path, usbtrail::util::Logger& log,
                                        bool* found = nullptr);

// Write settings as TOML; creates the parent directory.
bool save_settings(const usbtrail::model::Settings& s, const std::filesystem::path& path);

// "HH:MM" with 0 <= HH < 24 and 0 <= MM < 60.
std::optional<usbtrail::model::ClockTime> parse_clock_time(const std::string& text);
std::string format_clock_time(const usbtrail::model::ClockTime& t);

std::optional<usbtrail::model::DetectMode> parse_detect_mode(const std::string& text);
const char* to_string(usbtrail::model::DetectMode m);

// Environment variable helpers (USBTRAIL_FOO also accepted as usbtrail_foo)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace usbtrail::app
