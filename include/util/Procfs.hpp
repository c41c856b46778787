// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace usbtrail::util {

// Map an absolute /proc path to an alternate root if USBTRAIL_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if USBTRAIL_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Read entire file as string (after /proc or /sys remap). Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read a sysfs attribute and strip surrounding whitespace. Empty values count as missing.
auto read_attr(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// Decode the octal escapes (\040, \011, \012, \134) used by /proc/*/mounts.
auto unescape_mount_field(const std::string& s) -> std::string;

// Login name of the effective uid, or the numeric uid if it has no passwd entry.
auto current_username() -> std::string;

} // namespace usbtrail::util
