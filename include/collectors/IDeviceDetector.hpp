#pragma once
#include "model/Device.hpp"
#include <vector>

namespace usbtrail::collectors {

// Platform capability: enumerate currently mounted removable storage.
// The registry and poller are written against this interface only.
class IDeviceDetector {
public:
  virtual ~IDeviceDetector() = default;

  // Replace out with the current device universe. Return false on a
  // detection failure (out is then unspecified and must be ignored).
  [[nodiscard]] virtual bool detect(std::vector<usbtrail::model::Device>& out) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace usbtrail::collectors
