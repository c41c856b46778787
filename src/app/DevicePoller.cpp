#include "app/DevicePoller.hpp"

#include <algorithm>
#include <atomic>

namespace usbtrail::app {

using usbtrail::collectors::HotplugEvent;
using usbtrail::collectors::WaitResult;
using usbtrail::util::LogLevel;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {
constexpr milliseconds kWaitSlice{250};
}

struct DevicePoller::Core {
  Core(DeviceRegistry& r, usbtrail::collectors::IDeviceDetector& d,
       std::unique_ptr<usbtrail::collectors::IHotplugSource> h, usbtrail::util::Logger& l, PollerOptions o)
      : registry(r), detector(d), hotplug(std::move(h)), log(l), opts(o) {}

  bool poll_once();
  void run(std::stop_token st);
  // Returns when stop is requested (true) or the source failed (false).
  bool run_native(std::stop_token st);
  void run_polling(std::stop_token st);

  DeviceRegistry& registry;
  usbtrail::collectors::IDeviceDetector& detector;
  std::unique_ptr<usbtrail::collectors::IHotplugSource> hotplug;
  usbtrail::util::Logger& log;
  PollerOptions opts;
  std::atomic<Mode> mode{Mode::Idle};
};

DevicePoller::DevicePoller(DeviceRegistry& registry, usbtrail::collectors::IDeviceDetector& detector,
                           std::unique_ptr<usbtrail::collectors::IHotplugSource> hotplug,
                           usbtrail::util::Logger& log, PollerOptions opts)
    : core_(std::make_shared<Core>(registry, detector, std::move(hotplug), log, opts)), log_(log) {
  if (core_->opts.poll_interval < milliseconds(1)) core_->opts.poll_interval = milliseconds(1);
}

DevicePoller::~DevicePoller() {
  stop();
}

DevicePoller::Mode DevicePoller::mode() const {
  return abandoned_ ? Mode::Idle : core_->mode.load();
}

const char* DevicePoller::mode_name() const {
  switch (mode()) {
    case Mode::Native:  return "native";
    case Mode::Polling: return "polling";
    case Mode::Idle:    return "idle";
  }
  return "idle";
}

bool DevicePoller::poll_once() {
  return core_->poll_once();
}

void DevicePoller::start() {
  if (worker_.running()) return;
  if (abandoned_) {
    log_.warn("poller: previous loop never stopped; not restarting");
    return;
  }
  Core& c = *core_;
  Mode m = Mode::Polling;
  if (c.hotplug) {
    if (c.hotplug->init()) {
      m = Mode::Native;
    } else {
      log_.logf(LogLevel::Info, "poller: %s source unavailable; using polling", c.hotplug->name());
    }
  }
  c.mode.store(m);
  c.poll_once();
  log_.logf(LogLevel::Info, "poller: device detection in %s mode (%lldms)", mode_name(),
            static_cast<long long>(c.opts.poll_interval.count()));
  worker_.start([core = core_](std::stop_token st){ core->run(st); });
}

bool DevicePoller::stop() {
  if (abandoned_) return false;
  bool joined = worker_.stop(core_->opts.join_timeout);
  if (!joined) {
    log_.logf(LogLevel::Warn, "poller: loop did not stop within %lldms",
              static_cast<long long>(core_->opts.join_timeout.count()));
    // The loop keeps the core, and with it the hot-plug source, until it returns
    abandoned_ = true;
    return false;
  }
  if (core_->hotplug) core_->hotplug->shutdown();
  core_->mode.store(Mode::Idle);
  return true;
}

bool DevicePoller::Core::poll_once() {
  std::vector<usbtrail::model::Device> found;
  bool ok = false;
  try {
    ok = detector.detect(found);
  } catch (const std::exception& e) {
    log.logf(LogLevel::Warn, "poller: %s detector threw: %s", detector.name(), e.what());
    return false;
  }
  if (!ok) {
    log.logf(LogLevel::Warn, "poller: %s detection failed; skipping this cycle", detector.name());
    return false;
  }
  registry.refresh(found);
  return true;
}

void DevicePoller::Core::run(std::stop_token st) {
  if (mode.load() == Mode::Native) {
    if (run_native(st)) return;
    hotplug->shutdown();
    mode.store(Mode::Polling);
    log.warn("poller: hot-plug source failed; falling back to polling");
  }
  run_polling(st);
}

bool DevicePoller::Core::run_native(std::stop_token st) {
  auto next_reconcile = steady_clock::now() + opts.poll_interval;
  while (!st.stop_requested()) {
    auto now = steady_clock::now();
    if (now >= next_reconcile) {
      // Mounts that land after the settle window produce no further uevent
      poll_once();
      next_reconcile = steady_clock::now() + opts.poll_interval;
      continue;
    }
    auto slice = std::min(kWaitSlice, std::chrono::duration_cast<milliseconds>(next_reconcile - now));
    HotplugEvent ev;
    WaitResult r = hotplug->wait(slice, ev);
    if (r == WaitResult::Timeout) continue;
    if (r == WaitResult::Error) return false;

    log.logf(LogLevel::Debug, "poller: uevent %s %s", ev.action.c_str(),
             ev.devname.empty() ? ev.devpath.c_str() : ev.devname.c_str());
    if (ev.action == "add" || ev.action == "change") {
      if (!usbtrail::util::interruptible_sleep(st, opts.settle_delay)) break;
      poll_once();
      next_reconcile = steady_clock::now() + opts.poll_interval;
    } else if (ev.action == "remove") {
      poll_once();
    }
  }
  return true;
}

void DevicePoller::Core::run_polling(std::stop_token st) {
  while (usbtrail::util::interruptible_sleep(st, opts.poll_interval)) {
    poll_once();
  }
}

} // namespace usbtrail::app
