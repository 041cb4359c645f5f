#include "fetch_cache/runner.hpp"

#include <algorithm>

namespace fetch_cache {

OperationRunner::OperationRunner(Millis timeout) : timeout_(timeout) {}

// jthread requests stop and joins each parked worker on destruction.
OperationRunner::~OperationRunner() {
  std::lock_guard<std::mutex> lock(mu_);
  parked_.clear();
}

std::size_t OperationRunner::parked() const {
  std::lock_guard<std::mutex> lock(mu_);
  return parked_.size();
}

void OperationRunner::park(std::jthread worker,
                           std::shared_ptr<std::atomic<bool>> done) {
  std::lock_guard<std::mutex> lock(mu_);
  reap_locked();
  parked_.push_back({std::move(worker), std::move(done)});
}

void OperationRunner::reap() {
  std::lock_guard<std::mutex> lock(mu_);
  reap_locked();
}

void OperationRunner::reap_locked() {
  auto finished = std::partition(parked_.begin(), parked_.end(),
                                 [](const Parked &p) { return !p.done->load(); });
  parked_.erase(finished, parked_.end());
}

} // namespace fetch_cache
