#include "minitest.hpp"
#include "TestSupport.hpp"
#include "app/TransferLog.hpp"
#include "util/Clock.hpp"

#include <chrono>
#include <sstream>
#include <thread>

using namespace std::chrono_literals;
using usbtrail::app::IntegrityStatus;
using usbtrail::app::TransferLog;
using usbtrail::app::TransferLogOptions;
using usbtrail::model::OperationKind;
using usbtrail::model::TransferRecord;

namespace {

TransferRecord sample(const std::string& rel = "docs/report.docx") {
  TransferRecord r;
  r.timestamp = std::chrono::system_clock::now();
  r.operation = OperationKind::Created;
  r.device_name = "D1";
  r.relative_path = rel;
  r.file_size_bytes = 2097152;
  r.file_extension = ".docx";
  r.username = "alice";
  return r;
}

std::vector<std::string> lines_of(const std::filesystem::path& p) {
  std::istringstream in(testsupport::read_file(p));
  std::vector<std::string> out;
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

} // namespace

TEST(transfer_csv_escape) {
  using usbtrail::app::csv_escape;
  ASSERT_EQ(csv_escape("plain.txt"), "plain.txt");
  ASSERT_EQ(csv_escape("a,b.txt"), "\"a,b.txt\"");
  ASSERT_EQ(csv_escape("say \"hi\".txt"), "\"say \"\"hi\"\".txt\"");
  ASSERT_EQ(csv_escape("line\nbreak"), "\"line\nbreak\"");
}

TEST(transfer_format_record_columns) {
  auto r = sample("a,b.docx");
  auto line = usbtrail::app::format_record(r);
  auto ts = usbtrail::util::format_local(r.timestamp, "%Y-%m-%d %H:%M:%S");
  ASSERT_EQ(line, ts + ",created,D1,\"a,b.docx\",2097152,.docx,alice");
}

TEST(transfer_log_writes_header_once_and_digest) {
  testsupport::TempDir dir("tlog_basic");
  testsupport::RecordingLogger log;
  TransferLogOptions o;
  o.directory = dir / "logs";
  TransferLog tl(o, log);
  ASSERT_TRUE(tl.open());
  ASSERT_TRUE(tl.append(sample()));
  ASSERT_TRUE(tl.append(sample("b.txt")));

  auto file = tl.path_for(std::chrono::system_clock::now());
  ASSERT_EQ(file.filename().string(),
            "transfers_" + usbtrail::util::format_local(std::chrono::system_clock::now(), "%Y-%m-%d") + ".csv");
  auto lines = lines_of(file);
  ASSERT_EQ(lines.size(), size_t(3));
  ASSERT_EQ(lines[0], usbtrail::app::kTransferHeader);
  ASSERT_TRUE(lines[1].find(",created,D1,docs/report.docx,2097152,.docx,alice") != std::string::npos);

  auto v = usbtrail::app::verify_log_integrity(file);
  ASSERT_EQ(v.status, IntegrityStatus::Verified);
  ASSERT_EQ(v.message, "Log file integrity verified");
}

TEST(transfer_log_truncation_is_detected) {
  testsupport::TempDir dir("tlog_tamper");
  testsupport::RecordingLogger log;
  TransferLogOptions o;
  o.directory = dir.path();
  TransferLog tl(o, log);
  ASSERT_TRUE(tl.open());
  ASSERT_TRUE(tl.append(sample()));
  auto file = tl.path_for(std::chrono::system_clock::now());

  auto size = std::filesystem::file_size(file);
  std::filesystem::resize_file(file, size - 1);
  auto v = usbtrail::app::verify_log_integrity(file);
  ASSERT_EQ(v.status, IntegrityStatus::Mismatch);
}

TEST(transfer_log_missing_digest_and_unreadable) {
  testsupport::TempDir dir("tlog_missing");
  testsupport::write_file(dir / "transfers_2024-01-01.csv", "x\n");
  auto v = usbtrail::app::verify_log_integrity(dir / "transfers_2024-01-01.csv");
  ASSERT_EQ(v.status, IntegrityStatus::MissingDigest);
  ASSERT_EQ(v.message, "Hash file missing");

  testsupport::write_file(dir / "gone.csv.hash", "abc");
  auto u = usbtrail::app::verify_log_integrity(dir / "gone.csv");
  ASSERT_EQ(u.status, IntegrityStatus::Unreadable);
}

TEST(transfer_log_alternate_hash_algorithm) {
  testsupport::TempDir dir("tlog_sha512");
  testsupport::RecordingLogger log;
  TransferLogOptions o;
  o.directory = dir.path();
  o.hash_algorithm = "sha512";
  TransferLog tl(o, log);
  ASSERT_TRUE(tl.open());
  ASSERT_TRUE(tl.append(sample()));
  auto file = tl.path_for(std::chrono::system_clock::now());
  auto stored = testsupport::read_file(usbtrail::app::digest_path(file));
  ASSERT_EQ(stored.size(), size_t(128));
  ASSERT_EQ(usbtrail::app::verify_log_integrity(file, "sha512").status, IntegrityStatus::Verified);
}

TEST(transfer_log_unknown_algorithm_falls_back) {
  testsupport::TempDir dir("tlog_badalg");
  testsupport::RecordingLogger log;
  TransferLogOptions o;
  o.directory = dir.path();
  o.hash_algorithm = "no-such-digest";
  TransferLog tl(o, log);
  ASSERT_EQ(tl.hash_algorithm(), "sha256");
  ASSERT_TRUE(log.has("unknown hash algorithm"));
}

TEST(transfer_log_rotation_keeps_header_and_digests) {
  testsupport::TempDir dir("tlog_rotate");
  testsupport::RecordingLogger log;
  TransferLogOptions o;
  o.directory = dir.path();
  o.max_bytes = 300;
  o.backup_count = 2;
  TransferLog tl(o, log);
  ASSERT_TRUE(tl.open());
  for (int i = 0; i < 12; ++i) ASSERT_TRUE(tl.append(sample("file" + std::to_string(i) + ".docx")));

  auto file = tl.path_for(std::chrono::system_clock::now());
  auto b1 = std::filesystem::path(file.string() + ".1");
  auto b2 = std::filesystem::path(file.string() + ".2");
  auto b3 = std::filesystem::path(file.string() + ".3");
  ASSERT_TRUE(std::filesystem::exists(b1));
  ASSERT_TRUE(std::filesystem::exists(b2));
  ASSERT_FALSE(std::filesystem::exists(b3));
  ASSERT_TRUE(std::filesystem::file_size(file) <= 300);

  ASSERT_EQ(lines_of(file)[0], usbtrail::app::kTransferHeader);
  ASSERT_EQ(lines_of(b1)[0], usbtrail::app::kTransferHeader);
  ASSERT_EQ(usbtrail::app::verify_log_integrity(file).status, IntegrityStatus::Verified);
  ASSERT_EQ(usbtrail::app::verify_log_integrity(b1).status, IntegrityStatus::Verified);
  ASSERT_EQ(usbtrail::app::verify_log_integrity(b2).status, IntegrityStatus::Verified);
}

TEST(transfer_log_retention_removes_old_dated_files) {
  testsupport::TempDir dir("tlog_retention");
  testsupport::write_file(dir / "transfers_2000-01-01.csv", "old");
  testsupport::write_file(dir / "transfers_2000-01-01.csv.hash", "old");
  testsupport::write_file(dir / "app_2000-01-02.log", "old");
  testsupport::write_file(dir / "notes.txt", "keep");
  testsupport::write_file(dir / "weird_name.csv", "keep");
  auto today = usbtrail::util::format_local(std::chrono::system_clock::now(), "%Y-%m-%d");
  testsupport::write_file(dir / ("transfers_" + today + ".csv"), "keep");

  testsupport::RecordingLogger log;
  TransferLogOptions o;
  o.directory = dir.path();
  o.retention_days = 30;
  TransferLog tl(o, log);
  ASSERT_EQ(tl.cleanup_expired(), size_t(3));
  ASSERT_FALSE(std::filesystem::exists(dir / "transfers_2000-01-01.csv"));
  ASSERT_FALSE(std::filesystem::exists(dir / "transfers_2000-01-01.csv.hash"));
  ASSERT_FALSE(std::filesystem::exists(dir / "app_2000-01-02.log"));
  ASSERT_TRUE(std::filesystem::exists(dir / "notes.txt"));
  ASSERT_TRUE(std::filesystem::exists(dir / "weird_name.csv"));
  ASSERT_TRUE(std::filesystem::exists(dir / ("transfers_" + today + ".csv")));
}

TEST(transfer_log_concurrent_appends_stay_whole) {
  testsupport::TempDir dir("tlog_concurrent");
  testsupport::RecordingLogger log;
  TransferLogOptions o;
  o.directory = dir.path();
  TransferLog tl(o, log);
  ASSERT_TRUE(tl.open());

  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  std::atomic<int> failed{0};
  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t]{
      for (int i = 0; i < kPerThread; ++i) {
        auto rec = sample("w" + std::to_string(t) + "/file_" + std::to_string(i) + ".bin");
        if (!tl.append(rec)) ++failed;
      }
    });
  }
  for (auto& w : writers) w.join();
  ASSERT_EQ(failed.load(), 0);

  auto file = tl.path_for(std::chrono::system_clock::now());
  auto lines = lines_of(file);
  ASSERT_EQ(lines.size(), size_t(1 + kThreads * kPerThread));
  for (const auto& line : lines) {
    ASSERT_EQ(std::count(line.begin(), line.end(), ','), 6);
  }
  ASSERT_EQ(usbtrail::app::verify_log_integrity(file).status, IntegrityStatus::Verified);
}
