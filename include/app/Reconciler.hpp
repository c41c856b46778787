#pragma once
#include "app/PolicyEvaluator.hpp"
#include "app/TransferLog.hpp"
#include "model/Device.hpp"
#include "model/Transfer.hpp"
#include "util/Logger.hpp"
#include "util/Worker.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace usbtrail::app {

struct ReconcilerOptions {
  std::chrono::milliseconds completion_threshold{1000}; // quiet time before an operation is final
  std::chrono::milliseconds sweep_interval{500};
  std::chrono::milliseconds join_timeout{2000};
};

// Per-device debounce table. Raw events for one path collapse into a single
// in-flight operation (last kind wins, timer restarts); the sweep finalizes
// operations that stayed quiet past the completion threshold.
//
// The table and the sweep loop live in a shared core, so a sweep thread that
// missed its join timeout keeps running safely after the Reconciler is gone.
// policy, sink and log must outlive every sweep thread.
class Reconciler {
public:
  Reconciler(usbtrail::model::Device device, const PolicyEvaluator& policy, TransferSink& sink,
             usbtrail::util::Logger& log, ReconcilerOptions opts = {}, std::string username = {});
  ~Reconciler();
  Reconciler(const Reconciler&) = delete;
  Reconciler& operator=(const Reconciler&) = delete;

  // Watcher callback. Directory events are ignored.
  void ingest(const usbtrail::model::FsEvent& ev);

  // Finalize every operation older than the threshold at now. Returns the
  // number of records handed to the sink.
  size_t sweep(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

  void start();
  // Halts the sweep; pending operations are dropped. false if the sweep
  // thread did not finish within join_timeout (it is left to finish alone).
  bool stop();

  [[nodiscard]] size_t pending() const;
  [[nodiscard]] std::optional<usbtrail::model::InFlightOperation> pending_for(const std::string& path) const;
  [[nodiscard]] const usbtrail::model::Device& device() const;
  [[nodiscard]] const std::string& username() const;

private:
  struct Core;

  std::shared_ptr<Core> core_;
  usbtrail::util::Worker worker_;
};

} // namespace usbtrail::app
