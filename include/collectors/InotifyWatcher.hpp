#pragma once

#include "model/Transfer.hpp"
#include "util/Logger.hpp"
#include "util/Worker.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>

namespace usbtrail::collectors {

// Recursive inotify watch over one mount point. Raw notifications are
// translated to FsEvent and handed to the callback on the reader thread.
// Rename pairs (IN_MOVED_FROM/IN_MOVED_TO with the same cookie) become a
// single moved event carrying both paths.
//
// The descriptor and watch table belong to a core shared with the reader;
// a reader that missed its join timeout keeps the descriptor open until it
// returns. log must outlive every reader.
class InotifyWatcher {
public:
  using Callback = std::function<void(const usbtrail::model::FsEvent&)>;

  InotifyWatcher(std::filesystem::path root, Callback cb, usbtrail::util::Logger& log);
  ~InotifyWatcher();
  InotifyWatcher(const InotifyWatcher&) = delete;
  InotifyWatcher& operator=(const InotifyWatcher&) = delete;

  // Create the inotify instance, watch the tree and start the reader.
  // Returns false if the root cannot be watched.
  bool start();
  bool stop(std::chrono::milliseconds join_timeout = std::chrono::milliseconds(2000));

  [[nodiscard]] size_t watch_count() const;
  [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
  struct Core;

  std::filesystem::path root_;
  Callback cb_;
  usbtrail::util::Logger& log_;
  std::shared_ptr<Core> core_;
  usbtrail::util::Worker worker_;
};

} // namespace usbtrail::collectors
