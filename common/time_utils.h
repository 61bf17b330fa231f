#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>

namespace Common {

// Wall clock nanoseconds (CLOCK_REALTIME)
inline uint64_t getWallClockNanos() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Whole seconds since the Unix epoch for a system_clock time point
inline int64_t toUnixSeconds(std::chrono::system_clock::time_point tp) noexcept {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromUnixSeconds(int64_t seconds) noexcept {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace Common
