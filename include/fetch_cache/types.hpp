#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace fetch_cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

using Payload = std::vector<std::uint8_t>;

// Fixed per-entry bookkeeping cost used by the memory estimate.
inline constexpr std::size_t kEntryOverheadBytes = 32;

// Longest TTL, timeout or interval accepted from configuration. Half the
// clock's range, so `now + d` cannot overflow during the process lifetime.
inline constexpr std::uint64_t kMaxDurationMs = static_cast<std::uint64_t>(
    std::chrono::duration_cast<Millis>(Clock::duration::max()).count() / 2);

struct Entry {
  Payload value;
  TimePoint created_at{};
  TimePoint last_access{};
  Millis ttl{0};
  std::uint64_t access_count{0};

  bool expired(TimePoint now) const { return now - created_at > ttl; }
};

inline std::uint64_t elapsed_ms(TimePoint since, TimePoint until = Clock::now()) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<Millis>(until - since).count());
}

inline Payload to_payload(const std::string &s) {
  return Payload(s.begin(), s.end());
}

inline std::string to_string(const Payload &p) {
  return std::string(p.begin(), p.end());
}

} // namespace fetch_cache
