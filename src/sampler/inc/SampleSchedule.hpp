#ifndef MEMSAMPLER_SAMPLER_SAMPLE_SCHEDULE_HPP
#define MEMSAMPLER_SAMPLER_SAMPLE_SCHEDULE_HPP
/**
 * @file SampleSchedule.hpp
 * @brief Sampling cadence: delay plus either a repeat count or a total period.
 *
 * Exactly one of repeat count / total period is user-supplied; the other is
 * derived so the two always agree:
 *  - count given:  totalPeriod = delay * count
 *  - period given: count = floor(period / delay)
 */

#include <cstdint>  // std::uint64_t, std::uint8_t
#include <optional> // std::optional
#include <string>   // std::string

namespace memsampler {

namespace sampler {

/* ----------------------------- Constants ----------------------------- */

/// Smallest accepted delay between samples (seconds).
inline constexpr double MIN_DELAY_SEC = 0.01;

/// Delay used when none is requested (seconds).
inline constexpr double DEFAULT_DELAY_SEC = 1.0;

/// Repeat count used when neither count nor period is requested.
inline constexpr std::uint64_t DEFAULT_REPEAT_COUNT = 10;

/// Slack absorbing binary representation error in period / delay.
inline constexpr double PERIOD_RATIO_EPSILON = 1e-9;

/// Largest repeat count a period may imply.
inline constexpr double MAX_DERIVED_COUNT = 1e15;

/* ----------------------------- ScheduleStatus ----------------------------- */

/**
 * @brief Configuration errors detected before sampling starts.
 */
enum class ScheduleStatus : std::uint8_t {
  OK = 0,
  INVALID_DELAY,      ///< Delay below MIN_DELAY_SEC or not finite
  INVALID_COUNT,      ///< Repeat count of zero
  INVALID_PERIOD,     ///< Period not finite or shorter than one delay
  CONFLICTING_LIMITS, ///< Both count and period were supplied
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(ScheduleStatus status) noexcept;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Unvalidated user input.
 */
struct ScheduleRequest {
  double delaySec{DEFAULT_DELAY_SEC};
  std::optional<std::uint64_t> repeatCount{};
  std::optional<double> totalPeriodSec{};
};

/**
 * @brief Resolved, consistent schedule.
 */
struct SampleSchedule {
  double delaySec{DEFAULT_DELAY_SEC};           ///< Seconds between samples
  std::uint64_t repeatCount{DEFAULT_REPEAT_COUNT}; ///< Number of samples
  double totalPeriodSec{DEFAULT_DELAY_SEC * DEFAULT_REPEAT_COUNT}; ///< Run length
  bool periodBounded{false}; ///< Period was user-supplied; enables the deadline check

  /// @brief Total period in nanoseconds.
  [[nodiscard]] std::uint64_t totalPeriodNs() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Validate a request and derive the missing limit.
 * @param request User input.
 * @param out Resolved schedule (unchanged on error).
 * @return OK or the first configuration error found.
 */
[[nodiscard]] ScheduleStatus resolveSchedule(const ScheduleRequest& request,
                                             SampleSchedule& out) noexcept;

} // namespace sampler

} // namespace memsampler

#endif // MEMSAMPLER_SAMPLER_SAMPLE_SCHEDULE_HPP
