#pragma once

#include "fetch_cache/cache_store.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace fetch_cache {

// Runs CacheStore::sweep_expired on a fixed interval until destroyed. A zero
// interval starts no worker.
class ExpirySweeper {
public:
  ExpirySweeper(CacheStore &store, Millis interval);
  ~ExpirySweeper();

  ExpirySweeper(const ExpirySweeper &) = delete;
  ExpirySweeper &operator=(const ExpirySweeper &) = delete;

  void stop();
  std::uint64_t sweeps() const { return sweeps_.load(); }
  std::uint64_t removed() const { return removed_.load(); }

private:
  void run(std::stop_token stop);

  CacheStore &store_;
  Millis interval_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::atomic<std::uint64_t> sweeps_{0};
  std::atomic<std::uint64_t> removed_{0};
  std::jthread worker_;
};

} // namespace fetch_cache
