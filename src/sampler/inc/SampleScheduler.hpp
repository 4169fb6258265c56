#ifndef MEMSAMPLER_SAMPLER_SAMPLE_SCHEDULER_HPP
#define MEMSAMPLER_SAMPLER_SAMPLE_SCHEDULER_HPP
/**
 * @file SampleScheduler.hpp
 * @brief Sampling loop: sleep, timestamp, build, render, repeat.
 *
 * States: IDLE -> SAMPLING -> DONE. One sample is built and rendered before the
 * next sleep begins; the sleep is the only suspension point.
 *
 * The loop ends when any of these holds:
 *  - repeatCount rows have been rendered
 *  - the schedule is period-bounded and a sample timestamp passed the deadline
 *    (the row for that sample is still rendered)
 *  - the stop flag was raised during a sleep
 *  - a snapshot could not be built (fatal; no row for that sample)
 *
 * @note Single-threaded. The stop flag is the only state shared with a signal handler.
 */

#include "src/memory/inc/AccountingPolicy.hpp"
#include "src/memory/inc/MemorySnapshot.hpp"
#include "src/memory/inc/NodeTopology.hpp"
#include "src/report/inc/ReportRenderer.hpp"
#include "src/sampler/inc/SampleSchedule.hpp"

#include <atomic>     // std::atomic
#include <cstddef>    // std::size_t
#include <cstdint>    // std::int64_t, std::uint64_t
#include <cstdio>     // std::FILE
#include <functional> // std::function
#include <string>     // std::string

namespace memsampler {

namespace sampler {

/* ----------------------------- Constants ----------------------------- */

/// Per-iteration processing overhead subtracted from every sleep (microseconds).
inline constexpr std::int64_t SLEEP_OVERHEAD_US = 600;

/* ----------------------------- Types ----------------------------- */

/// Loop state.
enum class SchedulerState : std::uint8_t {
  IDLE = 0,
  SAMPLING,
  DONE,
};

/// Why the loop reached DONE.
enum class StopReason : std::uint8_t {
  NONE = 0,
  COUNT_EXHAUSTED,
  DEADLINE_REACHED,
  INTERRUPTED,
  FAILED,
};

/**
 * @brief Human-readable state string.
 */
[[nodiscard]] const char* toString(SchedulerState state) noexcept;

/**
 * @brief Human-readable stop reason string.
 */
[[nodiscard]] const char* toString(StopReason reason) noexcept;

/**
 * @brief Operations the loop performs; replaceable for tests.
 */
struct SampleHooks {
  /// Build one snapshot; on failure fill the message and return non-OK.
  std::function<memory::SourceStatus(memory::MemorySnapshot&, std::string&)> sample;

  /// Suspend for the given microseconds.
  std::function<void(std::int64_t)> sleepUs;

  /// Wall-clock now, nanoseconds since the epoch.
  std::function<std::uint64_t()> nowNs;
};

/**
 * @brief Loop tuning and output targets.
 */
struct SchedulerOptions {
  std::int64_t sleepOverheadUs{SLEEP_OVERHEAD_US}; ///< Subtracted from each sleep
  bool debug{false};                    ///< Per-sample timing on diag
  std::FILE* out{stdout};               ///< Report rows and completion marker
  std::FILE* diag{stderr};              ///< Debug and error diagnostics
  const std::atomic<bool>* stopFlag{nullptr}; ///< Raised to end the run early
};

/**
 * @brief Outcome of a run.
 */
struct RunResult {
  memory::SourceStatus status{memory::SourceStatus::OK}; ///< Non-OK only when FAILED
  StopReason reason{StopReason::NONE};
  SchedulerState state{SchedulerState::IDLE};
  std::size_t rows{0};  ///< Data rows rendered
  std::string error{};  ///< Diagnostic for a failed sample

  [[nodiscard]] bool ok() const noexcept { return status == memory::SourceStatus::OK; }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Sleep length per iteration.
 * @param delaySec Requested delay.
 * @param overheadUs Correction subtracted from the delay.
 * @return delaySec in microseconds minus overheadUs, clamped at 0.
 */
[[nodiscard]] std::int64_t computeIntervalUs(double delaySec, std::int64_t overheadUs) noexcept;

/**
 * @brief Hooks reading the live kernel interfaces with real sleeps.
 * @param sources Interface locations.
 * @param topo Topology discovered at startup (copied).
 * @param policy Policy resolved at startup.
 */
[[nodiscard]] SampleHooks makeSystemHooks(const memory::SnapshotSources& sources,
                                          const memory::NodeTopology& topo,
                                          memory::AccountingPolicy policy);

/**
 * @brief Run the sampling loop to completion.
 * @param schedule Resolved schedule.
 * @param renderer Renderer owning the row counter.
 * @param hooks Sample, sleep and clock operations.
 * @param options Tuning and output targets.
 * @return Final state, rows rendered and stop reason.
 * @note Writes the completion marker to options.out unless the run FAILED.
 */
[[nodiscard]] RunResult runSampler(const SampleSchedule& schedule,
                                   report::ReportRenderer& renderer, const SampleHooks& hooks,
                                   const SchedulerOptions& options = {});

} // namespace sampler

} // namespace memsampler

#endif // MEMSAMPLER_SAMPLER_SAMPLE_SCHEDULER_HPP
