#include "fetch_cache/config.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fetch_cache {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}

bool duration_fits(std::uint64_t ms) { return ms <= kMaxDurationMs; }

bool fail(std::string *err, std::string message) {
  if (err)
    *err = std::move(message);
  return false;
}

bool has_negative(const std::string &text, const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:\\s*-");
  return std::regex_search(text, re);
}
} // namespace

bool validate_config(const FetchConfig &cfg, std::string *err) {
  if (cfg.max_concurrency == 0) {
    if (err)
      *err = "max_concurrency must be greater than 0";
    return false;
  }
  if (cfg.operation_timeout_ms == 0) {
    if (err)
      *err = "operation_timeout_ms must be greater than 0";
    return false;
  }
  if (cfg.max_cache_entries == 0) {
    if (err)
      *err = "max_cache_entries must be greater than 0";
    return false;
  }
  if (!duration_fits(cfg.operation_timeout_ms))
    return fail(err, "operation_timeout_ms is too large");
  if (!duration_fits(cfg.default_ttl_ms))
    return fail(err, "default_ttl_ms is too large");
  if (!duration_fits(cfg.sweep_interval_ms))
    return fail(err, "sweep_interval_ms is too large");
  for (std::size_t i = 0; i < kEntityTypeCount; ++i) {
    const auto type = static_cast<EntityType>(i);
    const auto ttl = cfg.ttl.ttl_for(type);
    if (ttl && (ttl->count() < 0 ||
                !duration_fits(static_cast<std::uint64_t>(ttl->count()))))
      return fail(err, "ttl_" + entity_name(type) + "_ms is too large");
  }
  return true;
}

bool parse_config(const std::string &text, FetchConfig &cfg, std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  static const char *kNumericKeys[] = {"max_concurrency", "operation_timeout_ms",
                                       "default_ttl_ms", "max_cache_entries",
                                       "sweep_interval_ms"};
  for (const char *k : kNumericKeys) {
    if (has_negative(text, k)) {
      if (err)
        *err = std::string(k) + " must not be negative";
      return false;
    }
  }

  FetchConfig next = cfg;
  std::uint64_t u;
  try {
    if (extract_u64(text, "max_concurrency", u))
      next.max_concurrency = static_cast<std::size_t>(u);
    if (extract_u64(text, "operation_timeout_ms", u))
      next.operation_timeout_ms = u;
    if (extract_u64(text, "default_ttl_ms", u))
      next.default_ttl_ms = u;
    if (extract_u64(text, "max_cache_entries", u))
      next.max_cache_entries = static_cast<std::size_t>(u);
    if (extract_u64(text, "sweep_interval_ms", u))
      next.sweep_interval_ms = u;
    for (std::size_t i = 0; i < kEntityTypeCount; ++i) {
      const auto type = static_cast<EntityType>(i);
      if (!extract_u64(text, "ttl_" + entity_name(type) + "_ms", u))
        continue;
      if (!duration_fits(u))
        return fail(err, "ttl_" + entity_name(type) + "_ms is too large");
      next.ttl.set(type, Millis(static_cast<Millis::rep>(u)));
    }
  } catch (const std::out_of_range &) {
    if (err)
      *err = "numeric value out of range";
    return false;
  }

  if (!validate_config(next, err))
    return false;
  cfg = next;
  return true;
}

bool load_config(const std::string &path, FetchConfig &cfg, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), cfg, err);
}

} // namespace fetch_cache
