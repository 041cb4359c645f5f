#include "fetch_cache/sweeper.hpp"

namespace fetch_cache {

ExpirySweeper::ExpirySweeper(CacheStore &store, Millis interval)
    : store_(store), interval_(interval) {
  if (interval_ > Millis(0))
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

ExpirySweeper::~ExpirySweeper() { stop(); }

void ExpirySweeper::stop() {
  worker_.request_stop();
  if (worker_.joinable())
    worker_.join();
}

void ExpirySweeper::run(std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop.stop_requested()) {
    // Nothing notifies cv_; the wait ends on the interval or on stop.
    cv_.wait_for(lock, stop, interval_, [] { return false; });
    if (stop.stop_requested())
      break;
    lock.unlock();
    removed_ += store_.sweep_expired();
    ++sweeps_;
    lock.lock();
  }
}

} // namespace fetch_cache
