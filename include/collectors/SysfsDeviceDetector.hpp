#pragma once
#include "collectors/IDeviceDetector.hpp"
#include <optional>
#include <string>

namespace usbtrail::collectors {

// Linux detector: joins /proc/self/mounts with /sys/class/block to find
// mounted partitions whose backing disk is removable or hangs off a USB bus.
class SysfsDeviceDetector : public IDeviceDetector {
public:
  bool detect(std::vector<usbtrail::model::Device>& out) override;
  const char* name() const override { return "sysfs"; }

  struct BlockInfo {
    bool removable{false};
    bool usb{false};
    std::optional<std::string> vendor;
    std::optional<std::string> model;
    std::optional<std::string> serial;
    int partition{0};
  };

  // Inspect one kernel block device name (e.g., "sdb1"). std::nullopt if
  // it has no sysfs entry.
  [[nodiscard]] static std::optional<BlockInfo> inspect(const std::string& kname);

  // Stable id: "usb-<vendor>_<model>_<serial>[-part<N>]" or the device node.
  [[nodiscard]] static std::string make_device_id(const BlockInfo& info, const std::string& dev_node);
};

} // namespace usbtrail::collectors
