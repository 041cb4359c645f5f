#pragma once

#include "fetch_cache/policy.hpp"
#include "fetch_cache/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace fetch_cache {

struct CacheStoreConfig {
  std::size_t max_entries{1000};
  std::size_t max_key_len{256};
};

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  double hit_rate{0.0};
  std::size_t total_size{0};
  std::size_t memory_usage_bytes{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
};

// Keyed storage of time-bounded entries, capped by entry count. Every public
// operation takes the same lock, so one instance can be shared between the
// request path and the background sweeper.
class CacheStore {
public:
  explicit CacheStore(CacheStoreConfig cfg,
                      std::unique_ptr<IEvictionPolicy> policy = make_policy_by_name("lru"));

  // Expired entries found here count as a miss and are removed.
  std::optional<Payload> get(const std::string &key);
  // Evicts one entry first when full and `key` is new. Overwrites reset the
  // entry's timestamps and access count.
  bool put(const std::string &key, Payload value, Millis ttl,
           std::string *err = nullptr);
  bool erase(const std::string &key);
  bool contains(const std::string &key) const;
  void clear();
  std::size_t sweep_expired();

  CacheStats stats() const;
  std::string info() const;

  std::size_t size() const;
  std::size_t max_entries() const { return cfg_.max_entries; }
  const IEvictionPolicy &policy() const { return *policy_; }

  // Test and diagnostics access; returns a copy of the entry metadata.
  std::optional<Entry> peek(const std::string &key) const;

private:
  void evict_one();

  CacheStoreConfig cfg_;
  std::unique_ptr<IEvictionPolicy> policy_;
  std::unordered_map<std::string, Entry> entries_;
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t evictions_{0};
  std::uint64_t expirations_{0};
  mutable std::mutex mu_;
};

} // namespace fetch_cache
