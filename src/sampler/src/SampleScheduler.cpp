/**
 * @file SampleScheduler.cpp
 * @brief Implementation of the sampling loop.
 */

#include "src/sampler/inc/SampleScheduler.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <chrono>  // std::chrono::microseconds
#include <cmath>   // std::llround
#include <cstdio>  // std::fflush
#include <thread>  // std::this_thread::sleep_for
#include <utility> // std::move

#include <fmt/core.h>

namespace memsampler {

namespace sampler {

using memsampler::helpers::clock::getMonotonicNs;
using memsampler::helpers::clock::getRealtimeNs;
using memsampler::helpers::clock::NS_PER_MS;
using memsampler::helpers::clock::NS_PER_US;

namespace {

inline bool stopRequested(const SchedulerOptions& options) noexcept {
  return options.stopFlag != nullptr && options.stopFlag->load(std::memory_order_relaxed);
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(SchedulerState state) noexcept {
  switch (state) {
  case SchedulerState::IDLE:
    return "IDLE";
  case SchedulerState::SAMPLING:
    return "SAMPLING";
  case SchedulerState::DONE:
    return "DONE";
  }
  return "UNKNOWN";
}

const char* toString(StopReason reason) noexcept {
  switch (reason) {
  case StopReason::NONE:
    return "NONE";
  case StopReason::COUNT_EXHAUSTED:
    return "COUNT_EXHAUSTED";
  case StopReason::DEADLINE_REACHED:
    return "DEADLINE_REACHED";
  case StopReason::INTERRUPTED:
    return "INTERRUPTED";
  case StopReason::FAILED:
    return "FAILED";
  }
  return "UNKNOWN";
}

/* ----------------------------- API ----------------------------- */

std::int64_t computeIntervalUs(double delaySec, std::int64_t overheadUs) noexcept {
  const std::int64_t DELAY_US = static_cast<std::int64_t>(std::llround(delaySec * 1'000'000.0));
  const std::int64_t INTERVAL = DELAY_US - overheadUs;
  return (INTERVAL > 0) ? INTERVAL : 0;
}

SampleHooks makeSystemHooks(const memory::SnapshotSources& sources,
                            const memory::NodeTopology& topo, memory::AccountingPolicy policy) {
  SampleHooks hooks;
  hooks.sample = [sources, topo, policy](memory::MemorySnapshot& snap, std::string& error) {
    return memory::buildSnapshot(sources, topo, policy, snap, error);
  };
  hooks.sleepUs = [](std::int64_t us) {
    std::this_thread::sleep_for(std::chrono::microseconds(us));
  };
  hooks.nowNs = [] { return getRealtimeNs(); };
  return hooks;
}

RunResult runSampler(const SampleSchedule& schedule, report::ReportRenderer& renderer,
                     const SampleHooks& hooks, const SchedulerOptions& options) {
  RunResult result{};
  result.state = SchedulerState::IDLE;

  const std::int64_t INTERVAL_US = computeIntervalUs(schedule.delaySec, options.sleepOverheadUs);
  const std::uint64_t START_NS = hooks.nowNs();
  const std::uint64_t DEADLINE_NS = START_NS + schedule.totalPeriodNs();
  std::uint64_t prevNs = START_NS;

  result.state = SchedulerState::SAMPLING;
  for (std::uint64_t i = 1; i <= schedule.repeatCount; ++i) {
    hooks.sleepUs(INTERVAL_US);
    if (stopRequested(options)) {
      result.reason = StopReason::INTERRUPTED;
      break;
    }

    const std::uint64_t T1 = hooks.nowNs();
    const std::uint64_t ELAPSED_NS = (T1 > prevNs) ? (T1 - prevNs) : 0;
    prevNs = T1;

    memory::MemorySnapshot snap{};
    std::string error;
    const std::uint64_t BUILD_START_NS = getMonotonicNs();
    const memory::SourceStatus STATUS = hooks.sample(snap, error);
    const std::uint64_t BUILD_NS = getMonotonicNs() - BUILD_START_NS;

    if (STATUS != memory::SourceStatus::OK) {
      result.status = STATUS;
      result.reason = StopReason::FAILED;
      result.error = std::move(error);
      result.state = SchedulerState::DONE;
      return result;
    }

    snap.timestampNs = T1;
    fmt::print(options.out, "{}", renderer.renderRow(snap));
    std::fflush(options.out);
    ++result.rows;

    if (options.debug) {
      fmt::print(options.diag, "[debug] sample={} elapsed={:.3f}ms build={}us\n", i,
                 static_cast<double>(ELAPSED_NS) / static_cast<double>(NS_PER_MS),
                 BUILD_NS / NS_PER_US);
    }

    if (schedule.periodBounded && T1 > DEADLINE_NS) {
      result.reason = StopReason::DEADLINE_REACHED;
      break;
    }
  }

  if (result.reason == StopReason::NONE) {
    result.reason = StopReason::COUNT_EXHAUSTED;
  }
  result.state = SchedulerState::DONE;

  fmt::print(options.out, "{}", report::renderCompletion(result.rows));
  std::fflush(options.out);
  return result;
}

} // namespace sampler

} // namespace memsampler
