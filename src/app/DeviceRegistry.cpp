#include "app/DeviceRegistry.hpp"

#include <algorithm>
#include <unordered_set>

namespace fs = std::filesystem;

namespace usbtrail::app {

using usbtrail::model::Device;
using usbtrail::util::LogLevel;

DeviceRegistry::DeviceRegistry(usbtrail::util::Logger& log) : log_(log) {}

DeviceRegistry::RefreshResult DeviceRegistry::refresh(const std::vector<Device>& detected) {
  RefreshResult delta;
  {
    std::lock_guard<std::mutex> lk(mu_);
    std::unordered_set<std::string> seen;
    std::vector<Device> next;
    next.reserve(detected.size());
    for (const auto& d : detected) {
      if (seen.insert(d.device_id).second) next.push_back(d);
    }

    std::vector<Device> kept;
    for (auto& old : devices_) {
      if (seen.count(old.device_id)) kept.push_back(std::move(old));
      else delta.removed.push_back(std::move(old));
    }
    std::unordered_set<std::string> known;
    for (const auto& k : kept) known.insert(k.device_id);
    for (auto& d : next) {
      if (!known.count(d.device_id)) {
        delta.added.push_back(d);
        kept.push_back(std::move(d));
      }
    }
    devices_ = std::move(kept);
  }
  if (!delta.empty()) notify(delta);
  return delta;
}

bool DeviceRegistry::add(const Device& device) {
  RefreshResult delta;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find(devices_.begin(), devices_.end(), device);
    if (it != devices_.end()) return false;
    devices_.push_back(device);
    delta.added.push_back(device);
  }
  notify(delta);
  return true;
}

bool DeviceRegistry::remove(const std::string& device_id) {
  RefreshResult delta;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const Device& d){ return d.device_id == device_id; });
    if (it == devices_.end()) return false;
    delta.removed.push_back(std::move(*it));
    devices_.erase(it);
  }
  notify(delta);
  return true;
}

std::vector<Device> DeviceRegistry::list_connected() const {
  std::lock_guard<std::mutex> lk(mu_);
  return devices_;
}

bool DeviceRegistry::is_connected(const std::string& device_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::any_of(devices_.begin(), devices_.end(),
                     [&](const Device& d){ return d.device_id == device_id; });
}

size_t DeviceRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return devices_.size();
}

std::optional<Device> DeviceRegistry::find_by_mount_point(const fs::path& path) const {
  const std::string p = path.lexically_normal().string();
  std::lock_guard<std::mutex> lk(mu_);
  const Device* best = nullptr;
  for (const auto& d : devices_) {
    const std::string& m = d.mount_point;
    if (m.empty()) continue;
    bool inside = p == m || (p.size() > m.size() && p.compare(0, m.size(), m) == 0 &&
                             (m.back() == '/' || p[m.size()] == '/'));
    if (inside && (!best || m.size() > best->mount_point.size())) best = &d;
  }
  if (!best) return std::nullopt;
  return *best;
}

int DeviceRegistry::subscribe(Callback on_added, Callback on_removed) {
  std::lock_guard<std::mutex> lk(subs_mu_);
  int id = next_sub_id_++;
  subs_.push_back(Subscriber{id, std::move(on_added), std::move(on_removed)});
  return id;
}

bool DeviceRegistry::unsubscribe(int subscription_id) {
  std::lock_guard<std::mutex> lk(subs_mu_);
  auto it = std::find_if(subs_.begin(), subs_.end(), [&](const Subscriber& s){ return s.id == subscription_id; });
  if (it == subs_.end()) return false;
  subs_.erase(it);
  return true;
}

void DeviceRegistry::notify(const RefreshResult& delta) {
  std::vector<Subscriber> subs;
  {
    std::lock_guard<std::mutex> lk(subs_mu_);
    subs = subs_; // callbacks may subscribe/unsubscribe
  }
  auto deliver = [&](const Subscriber& s, const Callback& cb, const Device& d, const char* what) {
    if (!cb) return;
    try {
      cb(d);
    } catch (const std::exception& e) {
      log_.logf(LogLevel::Error, "registry: subscriber %d failed on %s of %s: %s",
                s.id, what, d.device_id.c_str(), e.what());
    }
  };
  for (const auto& d : delta.removed) {
    log_.logf(LogLevel::Info, "USB device removed: %s", usbtrail::model::describe(d).c_str());
    for (const auto& s : subs) deliver(s, s.on_removed, d, "removal");
  }
  for (const auto& d : delta.added) {
    log_.logf(LogLevel::Info, "USB device connected: %s", usbtrail::model::describe(d).c_str());
    for (const auto& s : subs) deliver(s, s.on_added, d, "addition");
  }
}

} // namespace usbtrail::app
