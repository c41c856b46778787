#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace usbtrail::model {

// A mounted removable storage device. Identity is device_id only; two
// Device values with the same id compare equal even if the mount moved.
struct Device {
  std::string device_id;    // e.g., "usb-SanDisk_Cruzer_4C530001" or "/dev/sdb1"
  std::string name;         // display name (model or volume label)
  std::string mount_point;  // root for relative paths, e.g., /media/alice/KEY
  std::optional<std::string> serial;
  std::optional<std::string> vendor;
  std::optional<std::string> model;
  std::string dev_node;     // e.g., /dev/sdb1
  std::string fstype;       // e.g., vfat, exfat
  std::chrono::system_clock::time_point connected_time{std::chrono::system_clock::now()};

  bool operator==(const Device& o) const { return device_id == o.device_id; }
};

struct DeviceHash {
  size_t operator()(const Device& d) const noexcept { return std::hash<std::string>{}(d.device_id); }
};

// "<name> (<mount_point>)"
[[nodiscard]] inline std::string describe(const Device& d) {
  return d.name + " (" + d.mount_point + ")";
}

} // namespace usbtrail::model
