#pragma once
#include "app/DeviceRegistry.hpp"
#include "collectors/IDeviceDetector.hpp"
#include "collectors/IHotplugSource.hpp"
#include "util/Logger.hpp"
#include "util/Worker.hpp"

#include <chrono>
#include <memory>

namespace usbtrail::app {

struct PollerOptions {
  std::chrono::milliseconds poll_interval{1000};   // polling mode period and native reconcile period
  std::chrono::milliseconds settle_delay{1000};    // wait after add/change before detecting
  std::chrono::milliseconds join_timeout{2000};
};

// Keeps the registry in sync with the attached devices. Runs in native mode
// when the hot-plug source initializes, otherwise (or after it fails) polls.
// The loop and the hot-plug source live in a core shared with the thread, so
// a loop that misses its join timeout can outlive the poller. registry,
// detector and log must outlive that loop.
class DevicePoller {
public:
  enum class Mode { Idle, Native, Polling };

  DevicePoller(DeviceRegistry& registry, usbtrail::collectors::IDeviceDetector& detector,
               std::unique_ptr<usbtrail::collectors::IHotplugSource> hotplug,
               usbtrail::util::Logger& log, PollerOptions opts = {});
  ~DevicePoller();
  DevicePoller(const DevicePoller&) = delete;
  DevicePoller& operator=(const DevicePoller&) = delete;

  // Announce already-attached devices with one refresh, then start the loop.
  // A poller whose loop was abandoned by stop() cannot be restarted.
  void start();
  // Returns false if the loop did not finish within join_timeout.
  bool stop();

  // detect() + refresh(); false when detection failed (registry untouched).
  bool poll_once();

  [[nodiscard]] Mode mode() const;
  [[nodiscard]] const char* mode_name() const;

private:
  struct Core;

  std::shared_ptr<Core> core_;
  usbtrail::util::Logger& log_;
  bool abandoned_{false};
  usbtrail::util::Worker worker_;
};

} // namespace usbtrail::app
