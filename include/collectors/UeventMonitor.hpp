#pragma once

#include "collectors/IHotplugSource.hpp"
#include <optional>
#include <string_view>

namespace usbtrail::collectors {

// Kernel uevents over NETLINK_KOBJECT_UEVENT, filtered to the block subsystem.
class UeventMonitor : public IHotplugSource {
public:
  UeventMonitor() = default;
  ~UeventMonitor() override;
  UeventMonitor(const UeventMonitor&) = delete;
  UeventMonitor& operator=(const UeventMonitor&) = delete;

  bool init() override;        // returns false if socket cannot be created/bound
  WaitResult wait(std::chrono::milliseconds timeout, HotplugEvent& out) override;
  void shutdown() override;
  const char* name() const override { return "uevent"; }

  // Parse one kernel datagram ("action@devpath\0KEY=VALUE\0..."). Messages
  // from udevd (which start with "libudev") are rejected.
  [[nodiscard]] static std::optional<HotplugEvent> parse(std::string_view datagram);

private:
  int sock_{-1};
};

} // namespace usbtrail::collectors
