#pragma once

#include "fetch_cache/entity.hpp"

#include <cstdint>
#include <string>

namespace fetch_cache {

struct FetchConfig {
  std::size_t max_concurrency{10};
  std::uint64_t operation_timeout_ms{30000};
  std::uint64_t default_ttl_ms{300000};
  std::size_t max_cache_entries{1000};
  // 0 disables the background expiry sweep.
  std::uint64_t sweep_interval_ms{30000};
  TtlTable ttl{};
};

bool validate_config(const FetchConfig &cfg, std::string *err = nullptr);

// Applies a flat JSON object over `cfg`. Recognised keys are the field names
// above plus `ttl_<entity>_ms`. On any error `cfg` is left untouched.
bool load_config(const std::string &path, FetchConfig &cfg,
                 std::string *err = nullptr);
bool parse_config(const std::string &text, FetchConfig &cfg,
                  std::string *err = nullptr);

} // namespace fetch_cache
