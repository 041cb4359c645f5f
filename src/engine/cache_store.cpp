#include "fetch_cache/cache_store.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace fetch_cache {

CacheStore::CacheStore(CacheStoreConfig cfg, std::unique_ptr<IEvictionPolicy> policy)
    : cfg_(std::move(cfg)), policy_(std::move(policy)) {
  if (!policy_)
    policy_ = make_policy_by_name("lru");
}

std::optional<Payload> CacheStore::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }
  const auto now = Clock::now();
  if (it->second.expired(now)) {
    entries_.erase(it);
    ++expirations_;
    ++misses_;
    return std::nullopt;
  }
  auto &e = it->second;
  e.last_access = now;
  ++e.access_count;
  ++hits_;
  return e.value;
}

bool CacheStore::put(const std::string &key, Payload value, Millis ttl,
                     std::string *err) {
  if (key.empty() || key.size() > cfg_.max_key_len) {
    if (err)
      *err = "invalid key length";
    return false;
  }
  std::lock_guard<std::mutex> lock(mu_);
  if (!entries_.contains(key) && entries_.size() >= cfg_.max_entries)
    evict_one();

  Entry e;
  e.value = std::move(value);
  e.created_at = Clock::now();
  e.last_access = e.created_at;
  e.ttl = ttl;
  e.access_count = 1;
  entries_[key] = std::move(e);
  return true;
}

bool CacheStore::erase(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.erase(key) > 0;
}

bool CacheStore::contains(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  return it != entries_.end() && !it->second.expired(Clock::now());
}

void CacheStore::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
  hits_ = 0;
  misses_ = 0;
  evictions_ = 0;
  expirations_ = 0;
}

std::size_t CacheStore::sweep_expired() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expired(now)) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  expirations_ += removed;
  return removed;
}

CacheStats CacheStore::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  CacheStats s;
  s.hits = hits_;
  s.misses = misses_;
  const auto total = hits_ + misses_;
  s.hit_rate = total == 0 ? 0.0
                          : static_cast<double>(hits_) / static_cast<double>(total);
  s.total_size = entries_.size();
  for (const auto &[k, e] : entries_)
    s.memory_usage_bytes += k.size() + e.value.size() + kEntryOverheadBytes;
  s.evictions = evictions_;
  s.expirations = expirations_;
  return s;
}

std::string CacheStore::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "policy:" << policy_->name() << "\n";
  os << "keys:" << s.total_size << "\n";
  os << "max_entries:" << cfg_.max_entries << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "hit_rate:" << s.hit_rate << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "expirations:" << s.expirations << "\n";
  os << "memory_usage_bytes:" << s.memory_usage_bytes << "\n";

  std::vector<std::pair<std::string, std::uint64_t>> counts;
  {
    std::lock_guard<std::mutex> lock(mu_);
    counts.reserve(entries_.size());
    for (const auto &[k, v] : entries_)
      counts.emplace_back(k, v.access_count);
  }
  std::sort(counts.begin(), counts.end(), [](const auto &a, const auto &b) {
    if (a.second == b.second)
      return a.first < b.first;
    return a.second > b.second;
  });
  os << "topk_hits:";
  for (std::size_t i = 0; i < std::min<std::size_t>(5, counts.size()); ++i) {
    if (i)
      os << ",";
    os << counts[i].first << ":" << counts[i].second;
  }
  os << "\n";
  return os.str();
}

std::size_t CacheStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

std::optional<Entry> CacheStore::peek(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

void CacheStore::evict_one() {
  auto victim = policy_->pick_victim(entries_);
  if (!victim.has_value())
    return;
  entries_.erase(*victim);
  ++evictions_;
}

} // namespace fetch_cache
