#include "util/Worker.hpp"

namespace usbtrail::util {

bool interruptible_sleep(const std::stop_token& st, std::chrono::milliseconds d) {
  std::mutex mu;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lk(mu);
  cv.wait_for(lk, st, d, []{ return false; });
  return !st.stop_requested();
}

Worker::~Worker() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void Worker::start(std::function<void(std::stop_token)> fn) {
  if (thread_.joinable()) return;
  auto done = std::make_shared<Done>();
  done_ = done;
  thread_ = std::jthread([done, fn = std::move(fn)](std::stop_token st){
    fn(st);
    std::lock_guard<std::mutex> lk(done->mu);
    done->finished = true;
    done->cv.notify_all();
  });
}

bool Worker::stop(std::chrono::milliseconds timeout) {
  if (!thread_.joinable()) return true;
  thread_.request_stop();
  bool finished = false;
  {
    std::unique_lock<std::mutex> lk(done_->mu);
    finished = done_->cv.wait_for(lk, timeout, [&]{ return done_->finished; });
  }
  if (finished) {
    thread_.join();
    return true;
  }
  thread_.detach();
  return false;
}

} // namespace usbtrail::util
