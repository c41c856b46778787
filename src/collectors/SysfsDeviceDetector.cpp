#include "collectors/SysfsDeviceDetector.hpp"
#include "util/Procfs.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;

namespace usbtrail::collectors {

static std::string sanitize_id_part(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '.' || c == '-') out.push_back(static_cast<char>(c));
    else out.push_back('_');
  }
  return out;
}

std::optional<SysfsDeviceDetector::BlockInfo> SysfsDeviceDetector::inspect(const std::string& kname) {
  if (kname.empty() || kname.find('/') != std::string::npos) return std::nullopt;
  std::error_code ec;
  fs::path cls = util::map_sys_path("/sys/class/block/" + kname);
  if (!fs::exists(cls, ec)) return std::nullopt;
  fs::path real = fs::canonical(cls, ec);
  if (ec) return std::nullopt;

  BlockInfo info;
  fs::path disk = real;
  if (auto part = util::read_attr((real / "partition").string())) {
    try { info.partition = std::stoi(*part); } catch (const std::logic_error&) { info.partition = 0; }
    disk = real.parent_path();
  }
  info.removable = util::read_attr((disk / "removable").string()).value_or("0") == "1";
  info.vendor = util::read_attr((disk / "device" / "vendor").string());
  info.model = util::read_attr((disk / "device" / "model").string());

  // Walk towards the root: a usbN component means the disk sits on a USB
  // bus, and the first ancestor with idVendor+serial is the USB device.
  for (fs::path p = disk; p.has_relative_path() && p.filename() != "devices"; p = p.parent_path()) {
    auto leaf = p.filename().string();
    if (leaf.rfind("usb", 0) == 0) info.usb = true;
    if (!info.serial && fs::exists(p / "idVendor", ec)) {
      info.serial = util::read_attr((p / "serial").string());
      if (!info.vendor) info.vendor = util::read_attr((p / "manufacturer").string());
      if (!info.model) info.model = util::read_attr((p / "product").string());
    }
  }
  return info;
}

std::string SysfsDeviceDetector::make_device_id(const BlockInfo& info, const std::string& dev_node) {
  if (!info.serial) return dev_node;
  std::string id = "usb-" + sanitize_id_part(info.vendor.value_or("")) + "_" +
                   sanitize_id_part(info.model.value_or("")) + "_" + sanitize_id_part(*info.serial);
  if (info.partition > 0) id += "-part" + std::to_string(info.partition);
  return id;
}

bool SysfsDeviceDetector::detect(std::vector<usbtrail::model::Device>& out) {
  auto mounts = util::read_file_string("/proc/self/mounts");
  if (!mounts) return false;
  out.clear();
  std::unordered_set<std::string> seen;
  std::istringstream ss(*mounts);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    if (device.rfind("/dev/", 0) != 0) continue;
    device = util::unescape_mount_field(device);
    mountpoint = util::unescape_mount_field(mountpoint);

    // /dev/disk/by-*/ links resolve to the kernel name when /dev is real
    std::error_code ec;
    std::string kname = fs::path(device).filename().string();
    auto resolved = fs::canonical(device, ec);
    if (!ec) kname = resolved.filename().string();

    auto info = inspect(kname);
    if (!info || (!info->removable && !info->usb)) continue;

    usbtrail::model::Device d;
    d.device_id = make_device_id(*info, "/dev/" + kname);
    if (!seen.insert(d.device_id).second) continue; // bind mounts of the same partition
    d.mount_point = mountpoint;
    d.dev_node = "/dev/" + kname;
    d.fstype = fstype;
    d.serial = info->serial;
    d.vendor = info->vendor.value_or("Unknown");
    d.model = info->model.value_or("USB Storage");
    d.name = *d.model;
    out.push_back(std::move(d));
  }
  return true;
}

} // namespace usbtrail::collectors
