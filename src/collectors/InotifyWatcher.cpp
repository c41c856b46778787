#include "collectors/InotifyWatcher.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <poll.h>
#include <string>
#include <sys/inotify.h>
#include <unistd.h>
#include <unordered_map>

namespace fs = std::filesystem;

namespace usbtrail::collectors {

namespace {

// No IN_CLOSE_WRITE: writes surface through IN_MODIFY, and a touch stays a create.
constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_DELETE |
                                IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF;
constexpr size_t kBufferSize = 64 * 1024;
constexpr auto kMoveGrace = std::chrono::milliseconds(100);

bool under(const std::string& path, const std::string& dir) {
  return path == dir || (path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/');
}

} // namespace

struct InotifyWatcher::Core {
  Core(fs::path r, Callback c, usbtrail::util::Logger& l) : root(std::move(r)), cb(std::move(c)), log(l) {}
  ~Core() { close_fd(); }

  void close_fd();
  void run(std::stop_token st);
  void add_tree(const fs::path& dir, bool announce_files);
  void handle(const struct inotify_event* ev);
  void flush_moves(bool all);
  void retarget_watches(const std::string& from, const std::string& to);
  void emit(usbtrail::model::FsEvent ev);
  [[nodiscard]] size_t watch_count() const;

  struct PendingMove {
    std::string path;
    bool is_dir{false};
    std::chrono::steady_clock::time_point seen{};
  };

  const fs::path root;
  const Callback cb;
  usbtrail::util::Logger& log;
  int fd{-1};
  mutable std::mutex mu;
  std::unordered_map<int, std::string> watches; // wd -> directory
  std::unordered_map<uint32_t, PendingMove> moves; // cookie -> source; reader thread only
};

InotifyWatcher::InotifyWatcher(fs::path root, Callback cb, usbtrail::util::Logger& log)
    : root_(std::move(root)), cb_(std::move(cb)), log_(log) {}

InotifyWatcher::~InotifyWatcher() { stop(); }

bool InotifyWatcher::start() {
  if (core_) return true;
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    log_.logf(usbtrail::util::LogLevel::Error, "watcher: %s is not a directory", root_.c_str());
    return false;
  }
  auto core = std::make_shared<Core>(root_, cb_, log_);
  core->fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (core->fd < 0) {
    log_.logf(usbtrail::util::LogLevel::Error, "watcher: inotify_init1 failed: %s", std::strerror(errno));
    return false;
  }
  core->add_tree(root_, false);
  if (core->watch_count() == 0) {
    log_.logf(usbtrail::util::LogLevel::Error, "watcher: unable to watch %s", root_.c_str());
    return false;
  }
  log_.logf(usbtrail::util::LogLevel::Debug, "watcher: %zu directories watched under %s",
            core->watch_count(), root_.c_str());
  core_ = core;
  worker_.start([core](std::stop_token st){ core->run(st); });
  return true;
}

bool InotifyWatcher::stop(std::chrono::milliseconds join_timeout) {
  bool joined = worker_.stop(join_timeout);
  if (!joined) {
    log_.logf(usbtrail::util::LogLevel::Warn, "watcher: reader for %s did not stop within %lldms",
              root_.c_str(), static_cast<long long>(join_timeout.count()));
  }
  if (core_ && joined) core_->close_fd();
  // A reader still running holds its own reference and closes the descriptor on exit
  core_.reset();
  return joined;
}

size_t InotifyWatcher::watch_count() const {
  return core_ ? core_->watch_count() : 0;
}

void InotifyWatcher::Core::close_fd() {
  std::lock_guard<std::mutex> lk(mu);
  if (fd != -1) {
    ::close(fd); // releases every watch descriptor
    fd = -1;
  }
  watches.clear();
}

size_t InotifyWatcher::Core::watch_count() const {
  std::lock_guard<std::mutex> lk(mu);
  return watches.size();
}

void InotifyWatcher::Core::add_tree(const fs::path& dir, bool announce_files) {
  auto add_one = [&](const fs::path& p) {
    int wd = ::inotify_add_watch(fd, p.c_str(), kWatchMask);
    if (wd < 0) {
      log.logf(usbtrail::util::LogLevel::Warn, "watcher: inotify_add_watch(%s) failed: %s",
               p.c_str(), std::strerror(errno));
      return;
    }
    std::lock_guard<std::mutex> lk(mu);
    watches[wd] = p.string();
  };

  add_one(dir);
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
       it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      ec.clear();
      continue;
    }
    if (it->is_directory(ec)) {
      add_one(it->path());
    } else if (announce_files && it->is_regular_file(ec)) {
      // Landed before the watch on its directory existed
      emit({usbtrail::model::OperationKind::Created, it->path().string(), std::nullopt, false});
    }
  }
}

void InotifyWatcher::Core::run(std::stop_token st) {
  alignas(struct inotify_event) static thread_local char buf[kBufferSize];
  while (!st.stop_requested()) {
    struct pollfd pfd{fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, 100);
    if (rc < 0) {
      if (errno == EINTR) continue;
      log.logf(usbtrail::util::LogLevel::Error, "watcher: poll failed on %s: %s", root.c_str(), std::strerror(errno));
      break;
    }
    if (rc > 0) {
      ssize_t n = ::read(fd, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) continue;
        log.logf(usbtrail::util::LogLevel::Error, "watcher: read failed on %s: %s", root.c_str(), std::strerror(errno));
        break;
      }
      ssize_t offset = 0;
      while (offset < n) {
        const auto* ev = reinterpret_cast<const struct inotify_event*>(buf + offset);
        offset += static_cast<ssize_t>(sizeof(struct inotify_event) + ev->len);
        handle(ev);
      }
    }
    flush_moves(false);
  }
  moves.clear();
}

void InotifyWatcher::Core::handle(const struct inotify_event* ev) {
  using usbtrail::model::OperationKind;
  if (ev->mask & IN_Q_OVERFLOW) {
    log.logf(usbtrail::util::LogLevel::Warn, "watcher: event queue overflow under %s; some operations were missed",
             root.c_str());
    return;
  }
  std::string dir;
  {
    std::lock_guard<std::mutex> lk(mu);
    auto it = watches.find(ev->wd);
    if (it == watches.end()) return;
    if (ev->mask & IN_IGNORED) {
      watches.erase(it);
      return;
    }
    dir = it->second;
  }
  if (ev->len == 0 || ev->name[0] == '\0') return; // IN_DELETE_SELF and friends: IN_IGNORED follows

  const std::string path = (fs::path(dir) / ev->name).string();
  const bool is_dir = (ev->mask & IN_ISDIR) != 0;

  if (ev->mask & IN_CREATE) {
    emit({OperationKind::Created, path, std::nullopt, is_dir});
    if (is_dir) add_tree(path, true);
  }
  if ((ev->mask & IN_MODIFY) && !is_dir) {
    emit({OperationKind::Modified, path, std::nullopt, false});
  }
  if (ev->mask & IN_DELETE) {
    emit({OperationKind::Deleted, path, std::nullopt, is_dir});
  }
  if (ev->mask & IN_MOVED_FROM) {
    moves[ev->cookie] = PendingMove{path, is_dir, std::chrono::steady_clock::now()};
  }
  if (ev->mask & IN_MOVED_TO) {
    auto it = moves.find(ev->cookie);
    if (it != moves.end()) {
      std::string src = it->second.path;
      moves.erase(it);
      if (is_dir) retarget_watches(src, path);
      emit({OperationKind::Moved, src, path, is_dir});
    } else {
      // Moved in from outside the watched tree
      if (is_dir) add_tree(path, true);
      emit({OperationKind::Moved, path, path, is_dir});
    }
  }
}

void InotifyWatcher::Core::flush_moves(bool all) {
  auto now = std::chrono::steady_clock::now();
  for (auto it = moves.begin(); it != moves.end(); ) {
    if (!all && now - it->second.seen < kMoveGrace) { ++it; continue; }
    // No IN_MOVED_TO arrived: the entry left the watched tree
    if (it->second.is_dir) {
      std::lock_guard<std::mutex> lk(mu);
      for (auto w = watches.begin(); w != watches.end(); ) {
        if (under(w->second, it->second.path)) {
          ::inotify_rm_watch(fd, w->first);
          w = watches.erase(w);
        } else {
          ++w;
        }
      }
    }
    emit({usbtrail::model::OperationKind::Moved, it->second.path, std::nullopt, it->second.is_dir});
    it = moves.erase(it);
  }
}

void InotifyWatcher::Core::retarget_watches(const std::string& from, const std::string& to) {
  std::lock_guard<std::mutex> lk(mu);
  for (auto& [wd, path] : watches) {
    if (under(path, from)) path = to + path.substr(from.size());
  }
}

void InotifyWatcher::Core::emit(usbtrail::model::FsEvent ev) {
  try {
    cb(ev);
  } catch (const std::exception& e) {
    log.logf(usbtrail::util::LogLevel::Error, "watcher: event handler failed for %s: %s", ev.path.c_str(), e.what());
  }
}

} // namespace usbtrail::collectors
