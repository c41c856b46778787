#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace usbtrail::util {

// Sleep up to d, returning early (false) once stop is requested.
bool interruptible_sleep(const std::stop_token& st, std::chrono::milliseconds d);

// A jthread whose stop() waits a bounded time for the loop to return.
// If the loop does not finish in time the thread is detached and stop()
// reports false; callers log it and carry on shutting down.
class Worker {
public:
  Worker() = default;
  ~Worker();
  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  void start(std::function<void(std::stop_token)> fn);
  bool stop(std::chrono::milliseconds timeout);
  [[nodiscard]] bool running() const { return thread_.joinable(); }

private:
  struct Done {
    std::mutex mu;
    std::condition_variable cv;
    bool finished{false};
  };
  std::shared_ptr<Done> done_;
  std::jthread thread_;
};

} // namespace usbtrail::util
