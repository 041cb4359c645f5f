#pragma once

#include "fetch_cache/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace fetch_cache {

class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  virtual std::optional<std::string>
  pick_victim(const std::unordered_map<std::string, Entry> &entries) const = 0;
};

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode);

} // namespace fetch_cache
