/**
 * @file SampleSchedule_uTest.cpp
 * @brief Unit tests for memsampler::sampler schedule resolution.
 *
 * Notes:
 *  - Count and period are mutually exclusive; the missing one is derived.
 */

#include "src/sampler/inc/SampleSchedule.hpp"

#include <gtest/gtest.h>

#include <limits>

using memsampler::sampler::DEFAULT_DELAY_SEC;
using memsampler::sampler::DEFAULT_REPEAT_COUNT;
using memsampler::sampler::resolveSchedule;
using memsampler::sampler::SampleSchedule;
using memsampler::sampler::ScheduleRequest;
using memsampler::sampler::ScheduleStatus;
using memsampler::sampler::toString;

/* ----------------------------- Derivation ----------------------------- */

/** @test No limits gives the default count and derived period. */
TEST(ResolveScheduleTest, Defaults) {
  SampleSchedule sched;
  ASSERT_EQ(resolveSchedule(ScheduleRequest{}, sched), ScheduleStatus::OK);
  EXPECT_DOUBLE_EQ(sched.delaySec, DEFAULT_DELAY_SEC);
  EXPECT_EQ(sched.repeatCount, DEFAULT_REPEAT_COUNT);
  EXPECT_DOUBLE_EQ(sched.totalPeriodSec, 10.0);
  EXPECT_FALSE(sched.periodBounded);
}

/** @test Count given: period is delay * count. */
TEST(ResolveScheduleTest, PeriodFromCount) {
  ScheduleRequest req;
  req.delaySec = 0.5;
  req.repeatCount = 5;

  SampleSchedule sched;
  ASSERT_EQ(resolveSchedule(req, sched), ScheduleStatus::OK);
  EXPECT_EQ(sched.repeatCount, 5U);
  EXPECT_DOUBLE_EQ(sched.totalPeriodSec, 2.5);
  EXPECT_FALSE(sched.periodBounded);
  EXPECT_EQ(sched.totalPeriodNs(), 2'500'000'000ULL);
}

/** @test Period given: count is the whole number of delays that fit. */
TEST(ResolveScheduleTest, CountFromPeriod) {
  ScheduleRequest req;
  req.delaySec = 0.25;
  req.totalPeriodSec = 1.1;

  SampleSchedule sched;
  ASSERT_EQ(resolveSchedule(req, sched), ScheduleStatus::OK);
  EXPECT_EQ(sched.repeatCount, 4U);
  EXPECT_DOUBLE_EQ(sched.totalPeriodSec, 1.1);
  EXPECT_TRUE(sched.periodBounded);
}

/** @test Exact multiples survive binary rounding (0.3 / 0.1). */
TEST(ResolveScheduleTest, ExactMultipleNotTruncated) {
  ScheduleRequest req;
  req.delaySec = 0.1;
  req.totalPeriodSec = 0.3;

  SampleSchedule sched;
  ASSERT_EQ(resolveSchedule(req, sched), ScheduleStatus::OK);
  EXPECT_EQ(sched.repeatCount, 3U);
}

/** @test Minimum delay is accepted. */
TEST(ResolveScheduleTest, MinimumDelay) {
  ScheduleRequest req;
  req.delaySec = 0.01;

  SampleSchedule sched;
  EXPECT_EQ(resolveSchedule(req, sched), ScheduleStatus::OK);
}

/* ----------------------------- Validation ----------------------------- */

/** @test Delay below the minimum or not finite is rejected. */
TEST(ResolveScheduleTest, InvalidDelay) {
  SampleSchedule sched;
  for (const double DELAY : {0.0, -1.0, 0.009, std::numeric_limits<double>::infinity(),
                             std::numeric_limits<double>::quiet_NaN()}) {
    ScheduleRequest req;
    req.delaySec = DELAY;
    EXPECT_EQ(resolveSchedule(req, sched), ScheduleStatus::INVALID_DELAY) << DELAY;
  }
}

/** @test Zero count is rejected. */
TEST(ResolveScheduleTest, InvalidCount) {
  ScheduleRequest req;
  req.repeatCount = 0;

  SampleSchedule sched;
  EXPECT_EQ(resolveSchedule(req, sched), ScheduleStatus::INVALID_COUNT);
}

/** @test Period shorter than one delay, non-positive or not finite is rejected. */
TEST(ResolveScheduleTest, InvalidPeriod) {
  SampleSchedule sched;
  for (const double PERIOD : {0.5, 0.0, -2.0, std::numeric_limits<double>::infinity()}) {
    ScheduleRequest req;
    req.delaySec = 1.0;
    req.totalPeriodSec = PERIOD;
    EXPECT_EQ(resolveSchedule(req, sched), ScheduleStatus::INVALID_PERIOD) << PERIOD;
  }
}

/** @test Count and period together are rejected. */
TEST(ResolveScheduleTest, ConflictingLimits) {
  ScheduleRequest req;
  req.repeatCount = 3;
  req.totalPeriodSec = 3.0;

  SampleSchedule sched;
  EXPECT_EQ(resolveSchedule(req, sched), ScheduleStatus::CONFLICTING_LIMITS);
}

/** @test Rejected requests leave the output untouched. */
TEST(ResolveScheduleTest, FailureLeavesOutput) {
  SampleSchedule sched;
  sched.repeatCount = 77;

  ScheduleRequest req;
  req.delaySec = 0.0;
  ASSERT_NE(resolveSchedule(req, sched), ScheduleStatus::OK);
  EXPECT_EQ(sched.repeatCount, 77U);
}

/* ----------------------------- Strings ----------------------------- */

/** @test Summary names the bounding limit. */
TEST(SampleScheduleTest, ToString) {
  SampleSchedule sched;
  ScheduleRequest req;
  req.totalPeriodSec = 3.0;
  ASSERT_EQ(resolveSchedule(req, sched), ScheduleStatus::OK);
  EXPECT_EQ(sched.toString(), "delay 1.000s x 3 samples = 3.000s (period-bounded)");
}

/** @test Status names. */
TEST(ScheduleStatusTest, ToStringNames) {
  EXPECT_STREQ(toString(ScheduleStatus::OK), "OK");
  EXPECT_STREQ(toString(ScheduleStatus::CONFLICTING_LIMITS), "CONFLICTING_LIMITS");
}
