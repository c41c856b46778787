#pragma once
#include "model/Device.hpp"
#include "util/Logger.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace usbtrail::app {

// Authoritative set of attached removable devices. Every change is computed as
// a diff keyed by device_id; subscribers hear about it after the lock is
// released, removals before additions.
class DeviceRegistry {
public:
  using Callback = std::function<void(const usbtrail::model::Device&)>;

  struct RefreshResult {
    std::vector<usbtrail::model::Device> added;   // detection order
    std::vector<usbtrail::model::Device> removed; // connection order
    [[nodiscard]] bool empty() const { return added.empty() && removed.empty(); }
  };

  explicit DeviceRegistry(usbtrail::util::Logger& log);
  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  // Replace the connected set with detected. Duplicate ids in detected are
  // collapsed to their first occurrence.
  RefreshResult refresh(const std::vector<usbtrail::model::Device>& detected);

  // Single-device deltas; false when nothing changed.
  bool add(const usbtrail::model::Device& device);
  bool remove(const std::string& device_id);

  [[nodiscard]] std::vector<usbtrail::model::Device> list_connected() const;
  [[nodiscard]] bool is_connected(const std::string& device_id) const;
  [[nodiscard]] size_t size() const;

  // Device whose mount point equals path or contains it (deepest mount wins).
  [[nodiscard]] std::optional<usbtrail::model::Device> find_by_mount_point(const std::filesystem::path& path) const;

  // Either callback may be empty. Returns a subscription id for unsubscribe().
  int subscribe(Callback on_added, Callback on_removed);
  bool unsubscribe(int subscription_id);

private:
  struct Subscriber {
    int id;
    Callback on_added;
    Callback on_removed;
  };

  void notify(const RefreshResult& delta);

  usbtrail::util::Logger& log_;
  mutable std::mutex mu_;
  std::vector<usbtrail::model::Device> devices_; // connection order
  mutable std::mutex subs_mu_;
  std::vector<Subscriber> subs_;
  int next_sub_id_{1};
};

} // namespace usbtrail::app
