/**
 * @file SampleSchedule.cpp
 * @brief Implementation of schedule validation and derivation.
 */

#include "src/sampler/inc/SampleSchedule.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <cmath> // std::floor, std::isfinite, std::llround

#include <fmt/core.h>

namespace memsampler {

namespace sampler {

using memsampler::helpers::clock::NS_PER_SEC;

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ScheduleStatus status) noexcept {
  switch (status) {
  case ScheduleStatus::OK:
    return "OK";
  case ScheduleStatus::INVALID_DELAY:
    return "INVALID_DELAY";
  case ScheduleStatus::INVALID_COUNT:
    return "INVALID_COUNT";
  case ScheduleStatus::INVALID_PERIOD:
    return "INVALID_PERIOD";
  case ScheduleStatus::CONFLICTING_LIMITS:
    return "CONFLICTING_LIMITS";
  }
  return "UNKNOWN";
}

/* ----------------------------- SampleSchedule Methods ----------------------------- */

std::uint64_t SampleSchedule::totalPeriodNs() const noexcept {
  if (!(totalPeriodSec > 0.0)) {
    return 0;
  }
  return static_cast<std::uint64_t>(std::llround(totalPeriodSec * static_cast<double>(NS_PER_SEC)));
}

std::string SampleSchedule::toString() const {
  return fmt::format("delay {:.3f}s x {} samples = {:.3f}s ({}-bounded)", delaySec, repeatCount,
                     totalPeriodSec, periodBounded ? "period" : "count");
}

/* ----------------------------- API ----------------------------- */

ScheduleStatus resolveSchedule(const ScheduleRequest& request, SampleSchedule& out) noexcept {
  if (!std::isfinite(request.delaySec) || request.delaySec < MIN_DELAY_SEC) {
    return ScheduleStatus::INVALID_DELAY;
  }
  if (request.repeatCount && request.totalPeriodSec) {
    return ScheduleStatus::CONFLICTING_LIMITS;
  }

  SampleSchedule sched{};
  sched.delaySec = request.delaySec;

  if (request.totalPeriodSec) {
    const double PERIOD = *request.totalPeriodSec;
    if (!std::isfinite(PERIOD) || PERIOD <= 0.0) {
      return ScheduleStatus::INVALID_PERIOD;
    }
    const double RATIO = std::floor(PERIOD / request.delaySec + PERIOD_RATIO_EPSILON);
    if (RATIO < 1.0 || RATIO > MAX_DERIVED_COUNT) {
      return ScheduleStatus::INVALID_PERIOD;
    }
    sched.repeatCount = static_cast<std::uint64_t>(RATIO);
    sched.totalPeriodSec = PERIOD;
    sched.periodBounded = true;
  } else {
    const std::uint64_t COUNT = request.repeatCount.value_or(DEFAULT_REPEAT_COUNT);
    if (COUNT == 0) {
      return ScheduleStatus::INVALID_COUNT;
    }
    sched.repeatCount = COUNT;
    sched.totalPeriodSec = request.delaySec * static_cast<double>(COUNT);
    sched.periodBounded = false;
  }

  out = sched;
  return ScheduleStatus::OK;
}

} // namespace sampler

} // namespace memsampler
