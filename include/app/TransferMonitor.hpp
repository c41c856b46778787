#pragma once
#include "app/DeviceRegistry.hpp"
#include "app/PolicyEvaluator.hpp"
#include "app/Reconciler.hpp"
#include "app/TransferLog.hpp"
#include "collectors/InotifyWatcher.hpp"
#include "util/Logger.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace usbtrail::app {

// Gives every connected device a watcher + reconciler pair for its mount
// point and tears the pair down when the device goes away.
class TransferMonitor {
public:
  TransferMonitor(DeviceRegistry& registry, const PolicyEvaluator& policy, TransferSink& sink,
                  usbtrail::util::Logger& log, ReconcilerOptions opts = {});
  ~TransferMonitor();
  TransferMonitor(const TransferMonitor&) = delete;
  TransferMonitor& operator=(const TransferMonitor&) = delete;

  // Subscribe to the registry and open sessions for devices already connected.
  void attach();
  // Unsubscribe and stop every session. false if any session thread missed
  // its join timeout and is still running.
  bool shutdown();

  [[nodiscard]] size_t active_sessions() const;
  [[nodiscard]] bool is_monitoring(const std::string& device_id) const;

private:
  struct Session {
    std::shared_ptr<Reconciler> reconciler; // also held by the watcher callback
    std::unique_ptr<usbtrail::collectors::InotifyWatcher> watcher;
  };

  void on_added(const usbtrail::model::Device& d);
  void on_removed(const usbtrail::model::Device& d);
  bool close_session(Session& s);

  DeviceRegistry& registry_;
  const PolicyEvaluator& policy_;
  TransferSink& sink_;
  usbtrail::util::Logger& log_;
  ReconcilerOptions opts_;
  int subscription_{0};

  mutable std::mutex mu_;
  std::unordered_map<std::string, Session> sessions_; // device_id -> session
};

} // namespace usbtrail::app
