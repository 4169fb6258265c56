#ifndef MEMSAMPLER_HELPERS_CLOCK_HPP
#define MEMSAMPLER_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Timestamp helpers for sample capture and instrumentation.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC, CLOCK_REALTIME

namespace memsampler {
namespace helpers {
namespace clock {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::uint64_t NS_PER_US = 1'000ULL;
inline constexpr std::uint64_t NS_PER_MS = 1'000'000ULL;
inline constexpr std::uint64_t NS_PER_SEC = 1'000'000'000ULL;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * Unaffected by wall-clock adjustments; used for measuring build time.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * NS_PER_SEC +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/**
 * @brief Get wall-clock timestamp in nanoseconds since the epoch.
 *
 * Sample timestamps and the period deadline use this clock so that rows
 * carry local time.
 */
[[nodiscard]] inline std::uint64_t getRealtimeNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * NS_PER_SEC +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

} // namespace clock
} // namespace helpers
} // namespace memsampler

#endif // MEMSAMPLER_HELPERS_CLOCK_HPP
