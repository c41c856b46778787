#include "minitest.hpp"
#include "TestSupport.hpp"
#include "app/Reconciler.hpp"

#include <chrono>

using namespace std::chrono_literals;
using usbtrail::app::PolicyEvaluator;
using usbtrail::app::Reconciler;
using usbtrail::app::ReconcilerOptions;
using usbtrail::model::FsEvent;
using usbtrail::model::OperationKind;
using usbtrail::model::Settings;

namespace {

Settings quiet_settings() {
  Settings s;
  s.alerts.time_based_alerts.enabled = false;
  return s;
}

FsEvent ev(OperationKind k, const std::filesystem::path& p) {
  return FsEvent{k, p.string(), std::nullopt, false};
}

auto later() { return std::chrono::steady_clock::now() + 5s; }

} // namespace

TEST(reconciler_burst_collapses_to_last_kind) {
  testsupport::TempDir dir("rec_burst");
  testsupport::write_sized_file(dir / "f.txt", 10);
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  PolicyEvaluator policy(quiet_settings());
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, {}, "alice");

  r.ingest(ev(OperationKind::Created, dir / "f.txt"));
  r.ingest(ev(OperationKind::Modified, dir / "f.txt"));
  r.ingest(ev(OperationKind::Modified, dir / "f.txt"));
  ASSERT_EQ(r.pending(), size_t(1));
  ASSERT_EQ(r.pending_for((dir / "f.txt").string())->kind, OperationKind::Modified);

  ASSERT_EQ(r.sweep(later()), size_t(1));
  auto recs = sink.records();
  ASSERT_EQ(recs.size(), size_t(1));
  ASSERT_EQ(recs[0].operation, OperationKind::Modified);
  ASSERT_EQ(recs[0].relative_path, "f.txt");
  ASSERT_EQ(recs[0].file_size_bytes, uint64_t(10));
  ASSERT_EQ(recs[0].file_extension, ".txt");
  ASSERT_EQ(recs[0].username, "alice");
  ASSERT_EQ(recs[0].device_name, "Test Stick");
  ASSERT_EQ(r.pending(), size_t(0));
}

TEST(reconciler_waits_for_quiet_period) {
  testsupport::TempDir dir("rec_quiet");
  testsupport::write_sized_file(dir / "f.txt", 1);
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  PolicyEvaluator policy(quiet_settings());
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, {}, "u");

  r.ingest(ev(OperationKind::Created, dir / "f.txt"));
  ASSERT_EQ(r.sweep(std::chrono::steady_clock::now()), size_t(0));
  ASSERT_EQ(r.pending(), size_t(1));
  ASSERT_EQ(sink.size(), size_t(0));
}

TEST(reconciler_ineligible_files_are_ignored) {
  testsupport::TempDir dir("rec_inelig");
  testsupport::write_sized_file(dir / "x.tmp", 10);
  std::filesystem::create_directories(dir / "folder");
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  PolicyEvaluator policy(quiet_settings());
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, {}, "u");

  r.ingest(ev(OperationKind::Created, dir / "x.tmp"));
  r.ingest(ev(OperationKind::Modified, dir / "nothere.txt"));
  r.ingest(FsEvent{OperationKind::Created, (dir / "folder").string(), std::nullopt, true});
  ASSERT_EQ(r.pending(), size_t(0));
}

TEST(reconciler_delete_recorded_without_eligibility) {
  testsupport::TempDir dir("rec_delete");
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  PolicyEvaluator policy(quiet_settings());
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, {}, "u");

  r.ingest(ev(OperationKind::Deleted, dir / "gone.tmp"));
  ASSERT_EQ(r.sweep(later()), size_t(1));
  auto recs = sink.records();
  ASSERT_EQ(recs[0].operation, OperationKind::Deleted);
  ASSERT_EQ(recs[0].file_size_bytes, uint64_t(0));
  ASSERT_EQ(recs[0].relative_path, "gone.tmp");
}

TEST(reconciler_vanished_file_is_not_finalized) {
  testsupport::TempDir dir("rec_vanish");
  testsupport::write_sized_file(dir / "f.txt", 10);
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  PolicyEvaluator policy(quiet_settings());
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, {}, "u");

  r.ingest(ev(OperationKind::Created, dir / "f.txt"));
  std::filesystem::remove(dir / "f.txt");
  ASSERT_EQ(r.sweep(later()), size_t(0));
  ASSERT_EQ(sink.size(), size_t(0));
  ASSERT_EQ(r.pending(), size_t(0));
}

TEST(reconciler_move_records_destination) {
  testsupport::TempDir dir("rec_move");
  testsupport::write_sized_file(dir / "sub/new.txt", 4);
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  PolicyEvaluator policy(quiet_settings());
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, {}, "u");

  r.ingest(FsEvent{OperationKind::Moved, (dir / "old.txt").string(), (dir / "sub/new.txt").string(), false});
  ASSERT_EQ(r.pending(), size_t(1));
  ASSERT_TRUE(r.pending_for((dir / "sub/new.txt").string()).has_value());
  r.sweep(later());
  auto recs = sink.records();
  ASSERT_EQ(recs.size(), size_t(1));
  ASSERT_EQ(recs[0].operation, OperationKind::Moved);
  ASSERT_EQ(recs[0].relative_path, "sub/new.txt");
}

TEST(reconciler_alerts_tag_pending_and_final_lines) {
  testsupport::TempDir dir("rec_alerts");
  testsupport::write_sized_file(dir / "report.docx", 2 * 1024 * 1024);
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  Settings s = quiet_settings();
  s.alerts.alert_threshold_mb = 1;
  s.alerts.large_transfer_threshold_mb = 1;
  PolicyEvaluator policy(s);
  Reconciler r(testsupport::make_device("d1", dir.path().string(), "D1"), policy, sink, log, {}, "bob");

  r.ingest(ev(OperationKind::Created, dir / "report.docx"));
  ASSERT_EQ(log.count_containing("(not final)"), size_t(2));
  r.sweep(later());
  ASSERT_EQ(log.count_containing("SUSPICIOUS FILE: created report.docx (2097152 bytes) on D1 by bob"), size_t(2));
  ASSERT_EQ(log.count_containing("LARGE FILE TRANSFER: created report.docx (2.00 MB) on D1 by bob"), size_t(2));
  ASSERT_TRUE(log.has("File created: report.docx (2097152 bytes) to/from D1 by bob"));
  ASSERT_FALSE(log.has("AFTER-HOURS"));
}

TEST(reconciler_disabled_alerts_still_record) {
  testsupport::TempDir dir("rec_noalerts");
  testsupport::write_sized_file(dir / "report.docx", 2 * 1024 * 1024);
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  Settings s;
  s.alerts.enable_alerts = false;
  s.alerts.alert_threshold_mb = 1;
  PolicyEvaluator policy(s);
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, {}, "u");

  r.ingest(ev(OperationKind::Created, dir / "report.docx"));
  r.sweep(later());
  ASSERT_EQ(sink.size(), size_t(1));
  ASSERT_EQ(log.count_level(usbtrail::util::LogLevel::Warn), size_t(0));
}

TEST(reconciler_sink_failure_is_logged_and_dropped) {
  testsupport::TempDir dir("rec_sinkfail");
  testsupport::write_sized_file(dir / "f.txt", 3);
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  sink.set_fail(true);
  PolicyEvaluator policy(quiet_settings());
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, {}, "u");

  r.ingest(ev(OperationKind::Created, dir / "f.txt"));
  r.sweep(later());
  ASSERT_EQ(r.pending(), size_t(0));
  ASSERT_TRUE(log.has("failed to record"));
  sink.set_fail(false);
  r.sweep(later());
  ASSERT_EQ(sink.size(), size_t(0));
}

TEST(reconciler_background_sweep_finalizes) {
  testsupport::TempDir dir("rec_bg");
  testsupport::write_sized_file(dir / "f.txt", 3);
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  PolicyEvaluator policy(quiet_settings());
  ReconcilerOptions opts;
  opts.completion_threshold = 100ms;
  opts.sweep_interval = 50ms;
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, opts, "u");
  r.start();
  r.ingest(ev(OperationKind::Created, dir / "f.txt"));
  ASSERT_TRUE(testsupport::wait_until([&]{ return sink.size() == 1; }, 3000ms));
  ASSERT_TRUE(r.stop());
}

TEST(reconciler_stop_drops_pending) {
  testsupport::TempDir dir("rec_stop");
  testsupport::write_sized_file(dir / "f.txt", 3);
  testsupport::RecordingLogger log;
  testsupport::MemorySink sink;
  PolicyEvaluator policy(quiet_settings());
  Reconciler r(testsupport::make_device("d1", dir.path().string()), policy, sink, log, {}, "u");
  r.start();
  r.ingest(ev(OperationKind::Created, dir / "f.txt"));
  ASSERT_TRUE(r.stop());
  ASSERT_EQ(r.pending(), size_t(0));
  ASSERT_EQ(sink.size(), size_t(0));
}

namespace {

// Sink whose append blocks long enough to outlast a short join timeout.
class StallingSink : public usbtrail::app::TransferSink {
public:
  bool append(const usbtrail::model::TransferRecord&) override {
    entered.store(true);
    std::this_thread::sleep_for(600ms);
    appended.fetch_add(1);
    return true;
  }
  std::atomic<bool> entered{false};
  std::atomic<int> appended{0};
};

} // namespace

TEST(reconciler_stalled_sweep_survives_destruction) {
  testsupport::TempDir dir("rec_stalled");
  testsupport::write_sized_file(dir / "f.txt", 3);
  testsupport::RecordingLogger log;
  StallingSink sink;
  PolicyEvaluator policy(quiet_settings());
  ReconcilerOptions opts;
  opts.completion_threshold = 20ms;
  opts.sweep_interval = 10ms;
  opts.join_timeout = 50ms;
  auto r = std::make_unique<Reconciler>(testsupport::make_device("d1", dir.path().string()), policy, sink, log,
                                        opts, "u");
  r->start();
  r->ingest(ev(OperationKind::Created, dir / "f.txt"));
  ASSERT_TRUE(testsupport::wait_until([&]{ return sink.entered.load(); }, 2000ms));

  ASSERT_FALSE(r->stop());
  ASSERT_TRUE(log.has("did not stop within"));
  r.reset();

  // The abandoned sweep finishes the record it was writing
  ASSERT_TRUE(testsupport::wait_until([&]{ return log.has("File created: f.txt (3 bytes)"); }, 3000ms));
  ASSERT_EQ(sink.appended.load(), 1);
  std::this_thread::sleep_for(100ms);
}
