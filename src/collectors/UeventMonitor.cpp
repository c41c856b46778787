#include "collectors/UeventMonitor.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <linux/netlink.h>

namespace usbtrail::collectors {

UeventMonitor::~UeventMonitor() { shutdown(); }

bool UeventMonitor::init() {
  if (sock_ != -1) return true;
  sock_ = ::socket(PF_NETLINK, SOCK_DGRAM | SOCK_CLOEXEC, NETLINK_KOBJECT_UEVENT);
  if (sock_ == -1) {
    return false; // permission or not available
  }

  struct sockaddr_nl addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.nl_family = AF_NETLINK;
  addr.nl_groups = 1; // kernel broadcast group (udevd re-broadcasts on 2)
  addr.nl_pid = 0;    // let the kernel assign a unique port id
  if (::bind(sock_, (struct sockaddr*)&addr, sizeof(addr)) == -1) {
    ::close(sock_); sock_ = -1; return false;
  }
  return true;
}

void UeventMonitor::shutdown() {
  if (sock_ != -1) {
    ::close(sock_);
    sock_ = -1;
  }
}

std::optional<HotplugEvent> UeventMonitor::parse(std::string_view datagram) {
  if (datagram.rfind("libudev", 0) == 0) return std::nullopt;
  auto first_nul = datagram.find('\0');
  auto header = datagram.substr(0, first_nul);
  auto at = header.find('@');
  if (at == std::string_view::npos) return std::nullopt;

  HotplugEvent ev;
  ev.action = std::string(header.substr(0, at));
  ev.devpath = std::string(header.substr(at + 1));
  if (first_nul == std::string_view::npos) return ev;

  size_t pos = first_nul + 1;
  while (pos < datagram.size()) {
    auto end = datagram.find('\0', pos);
    if (end == std::string_view::npos) end = datagram.size();
    auto kv = datagram.substr(pos, end - pos);
    auto eq = kv.find('=');
    if (eq != std::string_view::npos) {
      auto key = kv.substr(0, eq);
      auto val = std::string(kv.substr(eq + 1));
      if (key == "ACTION") ev.action = val;
      else if (key == "DEVPATH") ev.devpath = val;
      else if (key == "SUBSYSTEM") ev.subsystem = val;
      else if (key == "DEVTYPE") ev.devtype = val;
      else if (key == "DEVNAME") ev.devname = val;
    }
    pos = end + 1;
  }
  return ev;
}

WaitResult UeventMonitor::wait(std::chrono::milliseconds timeout, HotplugEvent& out) {
  if (sock_ == -1) return WaitResult::Error;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[8192];
  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() < 0) return WaitResult::Timeout;
    struct pollfd pfd{sock_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (rc == 0) return WaitResult::Timeout;
    if (rc < 0) {
      if (errno == EINTR) continue;
      return WaitResult::Error;
    }
    ssize_t n = ::recv(sock_, buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      if (errno == ENOBUFS) {
        // Receive queue overflowed: events were lost, force a full rescan
        out = HotplugEvent{"change", "", "block", "", ""};
        return WaitResult::Event;
      }
      return WaitResult::Error;
    }
    if (n == 0) return WaitResult::Error;
    auto ev = parse(std::string_view(buf, static_cast<size_t>(n)));
    if (!ev || ev->subsystem != "block") continue;
    out = std::move(*ev);
    return WaitResult::Event;
  }
}

} // namespace usbtrail::collectors
