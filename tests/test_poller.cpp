#include "minitest.hpp"
#include "TestSupport.hpp"
#include "app/DevicePoller.hpp"

#include <chrono>

using namespace std::chrono_literals;
using usbtrail::app::DevicePoller;
using usbtrail::app::DeviceRegistry;
using usbtrail::app::PollerOptions;

namespace {

PollerOptions fast_options() {
  PollerOptions o;
  o.poll_interval = 50ms;
  o.settle_delay = 20ms;
  o.join_timeout = 2000ms;
  return o;
}

} // namespace

TEST(poller_start_announces_attached_devices) {
  testsupport::RecordingLogger log;
  DeviceRegistry reg(log);
  testsupport::FakeDetector det;
  det.set({testsupport::make_device("a", "/media/a"), testsupport::make_device("b", "/media/b")});
  int added = 0;
  reg.subscribe([&](const usbtrail::model::Device&){ ++added; }, nullptr);

  DevicePoller p(reg, det, nullptr, log, fast_options());
  p.start();
  // the initial refresh happens before start() returns
  ASSERT_EQ(added, 2);
  ASSERT_EQ(p.mode(), DevicePoller::Mode::Polling);
  ASSERT_EQ(std::string(p.mode_name()), "polling");
  ASSERT_TRUE(p.stop());
  ASSERT_EQ(p.mode(), DevicePoller::Mode::Idle);
}

TEST(poller_polling_mode_tracks_changes) {
  testsupport::RecordingLogger log;
  DeviceRegistry reg(log);
  testsupport::FakeDetector det;
  DevicePoller p(reg, det, nullptr, log, fast_options());
  p.start();
  ASSERT_EQ(reg.size(), size_t(0));

  det.set({testsupport::make_device("a", "/media/a")});
  ASSERT_TRUE(testsupport::wait_until([&]{ return reg.is_connected("a"); }, 2000ms));
  det.set({});
  ASSERT_TRUE(testsupport::wait_until([&]{ return reg.size() == 0; }, 2000ms));
  ASSERT_TRUE(p.stop());
}

TEST(poller_detection_failure_keeps_registry) {
  testsupport::RecordingLogger log;
  DeviceRegistry reg(log);
  testsupport::FakeDetector det;
  det.set({testsupport::make_device("a", "/media/a")});
  DevicePoller p(reg, det, nullptr, log, fast_options());
  ASSERT_TRUE(p.poll_once());

  det.set_fail(true);
  ASSERT_FALSE(p.poll_once());
  ASSERT_TRUE(reg.is_connected("a"));
  ASSERT_TRUE(log.has("detection failed"));

  p.start();
  int before = det.calls();
  ASSERT_TRUE(testsupport::wait_until([&]{ return det.calls() >= before + 3; }, 2000ms));
  ASSERT_TRUE(reg.is_connected("a"));
  ASSERT_TRUE(p.stop());
}

TEST(poller_native_add_triggers_refresh) {
  testsupport::RecordingLogger log;
  DeviceRegistry reg(log);
  testsupport::FakeDetector det;
  auto src = std::make_unique<testsupport::FakeHotplug>(true);
  auto* hp = src.get();
  PollerOptions o = fast_options();
  o.poll_interval = 60000ms; // only the event can cause a refresh
  DevicePoller p(reg, det, std::move(src), log, o);
  p.start();
  ASSERT_EQ(p.mode(), DevicePoller::Mode::Native);
  int before = det.calls();

  det.set({testsupport::make_device("sdz1", "/media/z")});
  hp->push("add");
  ASSERT_TRUE(testsupport::wait_until([&]{ return reg.is_connected("sdz1"); }, 2000ms));
  ASSERT_TRUE(det.calls() > before);

  det.set({});
  hp->push("remove");
  ASSERT_TRUE(testsupport::wait_until([&]{ return reg.size() == 0; }, 2000ms));

  ASSERT_TRUE(p.stop());
  ASSERT_TRUE(hp->was_shut_down());
}

TEST(poller_native_periodic_reconcile) {
  testsupport::RecordingLogger log;
  DeviceRegistry reg(log);
  testsupport::FakeDetector det;
  DevicePoller p(reg, det, std::make_unique<testsupport::FakeHotplug>(true), log, fast_options());
  p.start();
  // no event at all: the reconcile pass picks the mount up
  det.set({testsupport::make_device("late", "/media/late")});
  ASSERT_TRUE(testsupport::wait_until([&]{ return reg.is_connected("late"); }, 2000ms));
  ASSERT_TRUE(p.stop());
}

TEST(poller_native_failure_falls_back_to_polling) {
  testsupport::RecordingLogger log;
  DeviceRegistry reg(log);
  testsupport::FakeDetector det;
  auto src = std::make_unique<testsupport::FakeHotplug>(true);
  auto* hp = src.get();
  DevicePoller p(reg, det, std::move(src), log, fast_options());
  p.start();
  hp->fail();
  ASSERT_TRUE(testsupport::wait_until([&]{ return p.mode() == DevicePoller::Mode::Polling; }, 2000ms));
  ASSERT_TRUE(log.has("falling back to polling"));
  ASSERT_TRUE(hp->was_shut_down());

  det.set({testsupport::make_device("a", "/media/a")});
  ASSERT_TRUE(testsupport::wait_until([&]{ return reg.is_connected("a"); }, 2000ms));
  ASSERT_TRUE(p.stop());
}

TEST(poller_init_failure_uses_polling) {
  testsupport::RecordingLogger log;
  DeviceRegistry reg(log);
  testsupport::FakeDetector det;
  DevicePoller p(reg, det, std::make_unique<testsupport::FakeHotplug>(false), log, fast_options());
  p.start();
  ASSERT_EQ(p.mode(), DevicePoller::Mode::Polling);
  ASSERT_TRUE(log.has("source unavailable"));
  ASSERT_TRUE(p.stop());
}

TEST(poller_stop_is_idempotent) {
  testsupport::RecordingLogger log;
  DeviceRegistry reg(log);
  testsupport::FakeDetector det;
  DevicePoller p(reg, det, nullptr, log, fast_options());
  ASSERT_TRUE(p.stop());
  p.start();
  ASSERT_TRUE(p.stop());
  ASSERT_TRUE(p.stop());
}

namespace {

// Detector that blocks once armed, holding the poller loop inside detect().
class StallingDetector : public usbtrail::collectors::IDeviceDetector {
public:
  bool detect(std::vector<usbtrail::model::Device>& out) override {
    if (armed.load()) {
      entered.store(true);
      std::this_thread::sleep_for(600ms);
      finished.store(true);
    }
    out.clear();
    return true;
  }
  const char* name() const override { return "stalling"; }

  std::atomic<bool> armed{false};
  std::atomic<bool> entered{false};
  std::atomic<bool> finished{false};
};

} // namespace

TEST(poller_stalled_loop_survives_destruction) {
  testsupport::RecordingLogger log;
  DeviceRegistry reg(log);
  StallingDetector det;
  PollerOptions o = fast_options();
  o.join_timeout = 50ms;
  auto src = std::make_unique<testsupport::FakeHotplug>(true);
  auto* hp = src.get();
  auto p = std::make_unique<DevicePoller>(reg, det, std::move(src), log, o);
  p->start();
  det.armed.store(true);
  ASSERT_TRUE(testsupport::wait_until([&]{ return det.entered.load(); }, 2000ms));

  ASSERT_FALSE(p->stop());
  ASSERT_EQ(p->mode(), DevicePoller::Mode::Idle);
  ASSERT_TRUE(log.has("loop did not stop"));
  // the loop still owns the source; it must not be shut down under it
  ASSERT_FALSE(hp->was_shut_down());
  p->start();
  ASSERT_TRUE(log.has("not restarting"));
  p.reset();

  ASSERT_TRUE(testsupport::wait_until([&]{ return det.finished.load(); }, 3000ms));
  std::this_thread::sleep_for(100ms);
}
