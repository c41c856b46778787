#pragma once
#include <chrono>
#include <string>

namespace usbtrail::collectors {

// One kernel hot-plug notification, reduced to what the poller needs.
struct HotplugEvent {
  std::string action;     // add|remove|change|bind|...
  std::string devpath;    // e.g., /devices/pci0000:00/.../block/sdb/sdb1
  std::string subsystem;  // e.g., block
  std::string devtype;    // disk|partition
  std::string devname;    // e.g., sdb1
};

enum class WaitResult { Event, Timeout, Error };

// Native hot-plug notification source. Optional: when init() fails the
// poller runs in polling mode.
class IHotplugSource {
public:
  virtual ~IHotplugSource() = default;

  // Return false if unavailable (permissions, platform).
  [[nodiscard]] virtual bool init() = 0;

  // Block up to timeout for the next event.
  [[nodiscard]] virtual WaitResult wait(std::chrono::milliseconds timeout, HotplugEvent& out) = 0;

  virtual void shutdown() {}

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace usbtrail::collectors
