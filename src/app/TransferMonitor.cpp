#include "app/TransferMonitor.hpp"

#include <vector>

namespace usbtrail::app {

using usbtrail::model::Device;
using usbtrail::util::LogLevel;

TransferMonitor::TransferMonitor(DeviceRegistry& registry, const PolicyEvaluator& policy, TransferSink& sink,
                                 usbtrail::util::Logger& log, ReconcilerOptions opts)
    : registry_(registry), policy_(policy), sink_(sink), log_(log), opts_(opts) {}

TransferMonitor::~TransferMonitor() { shutdown(); }

void TransferMonitor::attach() {
  if (subscription_ != 0) return;
  subscription_ = registry_.subscribe([this](const Device& d){ on_added(d); },
                                      [this](const Device& d){ on_removed(d); });
  for (const auto& d : registry_.list_connected()) on_added(d);
}

bool TransferMonitor::shutdown() {
  if (subscription_ != 0) {
    registry_.unsubscribe(subscription_);
    subscription_ = 0;
  }
  std::unordered_map<std::string, Session> sessions;
  {
    std::lock_guard<std::mutex> lk(mu_);
    sessions.swap(sessions_);
  }
  bool clean = true;
  for (auto& [id, s] : sessions) clean = close_session(s) && clean;
  return clean;
}

size_t TransferMonitor::active_sessions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.size();
}

bool TransferMonitor::is_monitoring(const std::string& device_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.count(device_id) != 0;
}

void TransferMonitor::on_added(const Device& d) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (sessions_.count(d.device_id)) return;
  }
  Session s;
  s.reconciler = std::make_shared<Reconciler>(d, policy_, sink_, log_, opts_);
  s.watcher = std::make_unique<usbtrail::collectors::InotifyWatcher>(
      d.mount_point, [r = s.reconciler](const usbtrail::model::FsEvent& ev){ r->ingest(ev); }, log_);

  s.reconciler->start();
  if (!s.watcher->start()) {
    log_.logf(LogLevel::Error, "monitor: cannot watch %s; device stays registered without monitoring",
              usbtrail::model::describe(d).c_str());
    if (!close_session(s)) log_.warn("monitor: sweep thread for an unwatched device did not stop");
    return;
  }
  log_.logf(LogLevel::Info, "Started monitoring %s", usbtrail::model::describe(d).c_str());

  std::lock_guard<std::mutex> lk(mu_);
  sessions_.emplace(d.device_id, std::move(s));
}

void TransferMonitor::on_removed(const Device& d) {
  Session s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(d.device_id);
    if (it == sessions_.end()) return;
    s = std::move(it->second);
    sessions_.erase(it);
  }
  if (!close_session(s)) {
    log_.logf(LogLevel::Warn, "monitor: %s left a worker running after removal",
              usbtrail::model::describe(d).c_str());
  }
  log_.logf(LogLevel::Info, "Stopped monitoring %s", usbtrail::model::describe(d).c_str());
}

bool TransferMonitor::close_session(Session& s) {
  // Watcher first so nothing is ingested into a stopped reconciler
  bool clean = true;
  if (s.watcher) clean = s.watcher->stop(opts_.join_timeout);
  if (s.reconciler) clean = s.reconciler->stop() && clean;
  return clean;
}

} // namespace usbtrail::app
