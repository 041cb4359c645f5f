#include "fetch_cache/policy.hpp"

#include <algorithm>

namespace fetch_cache {
namespace {

// Evicts the globally least recently accessed entry. Equal access times fall
// back to key order so the choice does not depend on hash iteration order.
class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }
  std::optional<std::string>
  pick_victim(const std::unordered_map<std::string, Entry> &entries) const override {
    if (entries.empty()) return std::nullopt;
    auto it = std::min_element(entries.begin(), entries.end(), [](const auto &a, const auto &b) {
      if (a.second.last_access == b.second.last_access) return a.first < b.first;
      return a.second.last_access < b.second.last_access;
    });
    return it->first;
  }
};

} // namespace

// lru is the only shipped policy and also the fallback for unknown modes.
std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &) {
  return std::make_unique<LruPolicy>();
}

} // namespace fetch_cache
