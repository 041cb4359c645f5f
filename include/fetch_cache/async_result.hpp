#pragma once

#include "fetch_cache/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fetch_cache {

enum class ErrorKind { None, Timeout, Failure };

inline constexpr const char *kTimeoutMessage = "Operation timeout";

// Outcome of one fetch attempt. `value` is set iff `success`,
// `error_message` iff not.
template <typename T> struct AsyncResult {
  bool success{false};
  std::optional<T> value;
  std::optional<std::string> error_message;
  ErrorKind error{ErrorKind::None};
  std::uint64_t elapsed_ms{0};
  bool from_cache{false};

  static AsyncResult ok(T v, std::uint64_t elapsed, bool cached = false) {
    AsyncResult r;
    r.success = true;
    r.value = std::move(v);
    r.elapsed_ms = elapsed;
    r.from_cache = cached;
    return r;
  }

  static AsyncResult fail(ErrorKind kind, std::string message,
                          std::uint64_t elapsed) {
    AsyncResult r;
    r.error = kind;
    r.error_message = std::move(message);
    r.elapsed_ms = elapsed;
    return r;
  }
};

template <typename T> struct BatchResult {
  std::vector<AsyncResult<T>> results;
  std::uint64_t total_elapsed_ms{0};
  std::size_t success_count{0};
  std::size_t error_count{0};
  double cache_hit_rate{0.0};
};

template <typename T>
BatchResult<T> summarize(std::vector<AsyncResult<T>> results, TimePoint start) {
  BatchResult<T> b;
  std::size_t cached = 0;
  for (const auto &r : results) {
    if (r.success)
      ++b.success_count;
    else
      ++b.error_count;
    if (r.from_cache)
      ++cached;
  }
  b.cache_hit_rate = results.empty() ? 0.0
                                     : static_cast<double>(cached) /
                                           static_cast<double>(results.size());
  b.results = std::move(results);
  b.total_elapsed_ms = elapsed_ms(start);
  return b;
}

template <typename T> std::string describe(const BatchResult<T> &b) {
  return "results:" + std::to_string(b.results.size()) +
         " success:" + std::to_string(b.success_count) +
         " errors:" + std::to_string(b.error_count) +
         " cache_hit_rate:" + std::to_string(b.cache_hit_rate) +
         " elapsed_ms:" + std::to_string(b.total_elapsed_ms);
}

} // namespace fetch_cache
