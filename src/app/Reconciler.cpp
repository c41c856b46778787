#include "app/Reconciler.hpp"
#include "util/Clock.hpp"
#include "util/Procfs.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace usbtrail::app {

using usbtrail::model::FsEvent;
using usbtrail::model::InFlightOperation;
using usbtrail::model::OperationKind;
using usbtrail::util::LogLevel;

struct Reconciler::Core {
  Core(usbtrail::model::Device d, const PolicyEvaluator& p, TransferSink& s, usbtrail::util::Logger& l,
       ReconcilerOptions o, std::string user)
      : device(std::move(d)), policy(p), sink(s), log(l), opts(o), username(std::move(user)) {}

  void record(OperationKind kind, const std::string& path);
  size_t sweep(std::chrono::steady_clock::time_point now);
  // Emit alert lines; when final also build and write the record.
  void classify(OperationKind kind, const std::string& path, bool final);
  [[nodiscard]] std::string relative_path(const std::string& abs) const;

  const usbtrail::model::Device device;
  const PolicyEvaluator& policy;
  TransferSink& sink;
  usbtrail::util::Logger& log;
  const ReconcilerOptions opts;
  const std::string username;

  mutable std::mutex mu;
  std::unordered_map<std::string, InFlightOperation> in_flight;
};

Reconciler::Reconciler(usbtrail::model::Device device, const PolicyEvaluator& policy, TransferSink& sink,
                       usbtrail::util::Logger& log, ReconcilerOptions opts, std::string username)
    : core_(std::make_shared<Core>(std::move(device), policy, sink, log, opts,
                                   username.empty() ? usbtrail::util::current_username() : std::move(username))) {}

Reconciler::~Reconciler() { stop(); }

const usbtrail::model::Device& Reconciler::device() const { return core_->device; }
const std::string& Reconciler::username() const { return core_->username; }

void Reconciler::start() {
  // The loop owns a reference to the core, never to this
  worker_.start([core = core_](std::stop_token st){
    while (usbtrail::util::interruptible_sleep(st, core->opts.sweep_interval)) {
      core->sweep(std::chrono::steady_clock::now());
    }
  });
}

bool Reconciler::stop() {
  bool joined = worker_.stop(core_->opts.join_timeout);
  if (!joined) {
    core_->log.logf(LogLevel::Warn, "reconciler: sweep for %s did not stop within %lldms",
                    core_->device.name.c_str(), static_cast<long long>(core_->opts.join_timeout.count()));
  }
  std::lock_guard<std::mutex> lk(core_->mu);
  core_->in_flight.clear();
  return joined;
}

void Reconciler::ingest(const FsEvent& ev) {
  if (ev.is_directory) return;
  switch (ev.kind) {
    case OperationKind::Deleted:
      // Nothing left to inspect
      core_->record(OperationKind::Deleted, ev.path);
      break;
    case OperationKind::Moved: {
      const std::string& target = ev.dest ? *ev.dest : ev.path;
      if (core_->policy.is_monitor_eligible(target)) core_->record(OperationKind::Moved, target);
      break;
    }
    case OperationKind::Created:
    case OperationKind::Modified:
      if (core_->policy.is_monitor_eligible(ev.path)) core_->record(ev.kind, ev.path);
      break;
  }
}

size_t Reconciler::sweep(std::chrono::steady_clock::time_point now) {
  return core_->sweep(now);
}

size_t Reconciler::pending() const {
  std::lock_guard<std::mutex> lk(core_->mu);
  return core_->in_flight.size();
}

std::optional<InFlightOperation> Reconciler::pending_for(const std::string& path) const {
  std::lock_guard<std::mutex> lk(core_->mu);
  auto it = core_->in_flight.find(path);
  if (it == core_->in_flight.end()) return std::nullopt;
  return it->second;
}

void Reconciler::Core::record(OperationKind kind, const std::string& path) {
  {
    std::lock_guard<std::mutex> lk(mu);
    in_flight[path] = InFlightOperation{kind, std::chrono::steady_clock::now()};
  }
  classify(kind, path, false);
}

size_t Reconciler::Core::sweep(std::chrono::steady_clock::time_point now) {
  std::vector<std::pair<std::string, OperationKind>> due;
  {
    std::lock_guard<std::mutex> lk(mu);
    for (auto it = in_flight.begin(); it != in_flight.end(); ) {
      if (now - it->second.start > opts.completion_threshold) {
        due.emplace_back(it->first, it->second.kind);
        it = in_flight.erase(it);
      } else {
        ++it;
      }
    }
  }
  size_t written = 0;
  for (const auto& [path, kind] : due) {
    std::error_code ec;
    if (kind != OperationKind::Deleted && !fs::exists(path, ec)) continue;
    classify(kind, path, true);
    ++written;
  }
  return written;
}

std::string Reconciler::Core::relative_path(const std::string& abs) const {
  auto rel = fs::path(abs).lexically_relative(device.mount_point);
  if (rel.empty()) return abs;
  return rel.string();
}

void Reconciler::Core::classify(OperationKind kind, const std::string& path, bool final) {
  const auto wall = std::chrono::system_clock::now();
  const std::string rel = relative_path(path);
  const char* op = usbtrail::model::to_string(kind);
  const char* tag = final ? "" : " (not final)";

  std::error_code ec;
  std::optional<uint64_t> size;
  if (fs::exists(path, ec)) {
    auto s = fs::file_size(path, ec);
    if (!ec) size = s;
  }
  const uint64_t bytes = size.value_or(0);

  if (policy.alerts_enabled()) {
    if (policy.is_large_transfer(bytes)) {
      log.logf(LogLevel::Warn, "LARGE FILE TRANSFER: %s %s (%.2f MB) on %s by %s%s",
               op, rel.c_str(), to_mb(bytes), device.name.c_str(), username.c_str(), tag);
    }
    if (policy.is_suspicious(path, size)) {
      log.logf(LogLevel::Warn, "SUSPICIOUS FILE: %s %s (%llu bytes) on %s by %s%s",
               op, rel.c_str(), static_cast<unsigned long long>(bytes), device.name.c_str(),
               username.c_str(), tag);
    }
    if (policy.is_restricted_time(usbtrail::util::local_tm(wall))) {
      log.logf(LogLevel::Warn, "AFTER-HOURS ACTIVITY: %s %s (%llu bytes) on %s by %s%s",
               op, rel.c_str(), static_cast<unsigned long long>(bytes), device.name.c_str(),
               username.c_str(), tag);
    }
  }
  if (!final) return;

  usbtrail::model::TransferRecord rec;
  rec.timestamp = wall;
  rec.operation = kind;
  rec.device_name = device.name;
  rec.relative_path = rel;
  rec.file_size_bytes = bytes;
  rec.file_extension = lower_extension(path);
  rec.username = username;
  bool ok = false;
  try {
    ok = sink.append(rec);
  } catch (const std::exception& e) {
    log.logf(LogLevel::Error, "reconciler: transfer sink threw for %s: %s", rel.c_str(), e.what());
  }
  if (!ok) {
    log.logf(LogLevel::Error, "reconciler: failed to record %s %s on %s", op, rel.c_str(), device.name.c_str());
    return;
  }
  log.logf(LogLevel::Info, "File %s: %s (%llu bytes) to/from %s by %s", op, rel.c_str(),
           static_cast<unsigned long long>(bytes), device.name.c_str(), username.c_str());
}

} // namespace usbtrail::app
