/**
 * @file mem-sample.cpp
 * @brief Periodic host-memory sampler with per-node availability and huge pages.
 *
 * Prints one fixed-width row per sample: global memory in MiB under the host's
 * accounting policy, followed by per-node availability and free huge pages.
 * The header repeats every 15 rows.
 *
 * Exit status: 0 on completion or interrupt, 1 on bad arguments, 2 when a
 * kernel interface is unavailable or incomplete.
 */

#include "src/memory/inc/AccountingPolicy.hpp"
#include "src/memory/inc/MemorySnapshot.hpp"
#include "src/memory/inc/NodeTopology.hpp"
#include "src/report/inc/ReportRenderer.hpp"
#include "src/sampler/inc/SampleSchedule.hpp"
#include "src/sampler/inc/SampleScheduler.hpp"
#include "src/helpers/inc/Args.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace mem = memsampler::memory;
namespace rep = memsampler::report;
namespace smp = memsampler::sampler;
namespace args = memsampler::helpers::args;

namespace {

/* ----------------------------- Exit Codes ----------------------------- */

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_INTERFACE = 2;

/* ----------------------------- Argument Handling ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_DELAY = 1,
  ARG_COUNT = 2,
  ARG_PERIOD = 3,
  ARG_DEBUG = 4,
};

constexpr std::string_view DESCRIPTION =
    "Sample host memory periodically: global availability under the overcommit\n"
    "accounting policy, per-node availability, and free huge pages (MiB).";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_DELAY] = {"--delay", 1, false, "Seconds between samples (default: 1.0, min: 0.01)"};
  map[ARG_COUNT] = {"--count", 1, false, "Number of samples (default: 10)"};
  map[ARG_PERIOD] = {"--period", 1, false, "Total sampling period in seconds (excludes --count)"};
  map[ARG_DEBUG] = {"--debug", 0, false, "Print per-sample timing to stderr"};
  return map;
}

/// Fill a schedule request from parsed flags; false with message on bad values.
bool buildRequest(const args::ParsedArgs& pargs, smp::ScheduleRequest& req, std::string& error) {
  if (pargs.count(ARG_DELAY) != 0) {
    const auto VAL = args::parseDouble(pargs.at(ARG_DELAY)[0]);
    if (!VAL) {
      error = fmt::format("--delay expects a number, got '{}'", pargs.at(ARG_DELAY)[0]);
      return false;
    }
    req.delaySec = *VAL;
  }

  if (pargs.count(ARG_COUNT) != 0) {
    const auto VAL = args::parseUint(pargs.at(ARG_COUNT)[0]);
    if (!VAL) {
      error = fmt::format("--count expects a positive integer, got '{}'", pargs.at(ARG_COUNT)[0]);
      return false;
    }
    req.repeatCount = *VAL;
  }

  if (pargs.count(ARG_PERIOD) != 0) {
    const auto VAL = args::parseDouble(pargs.at(ARG_PERIOD)[0]);
    if (!VAL) {
      error = fmt::format("--period expects a number, got '{}'", pargs.at(ARG_PERIOD)[0]);
      return false;
    }
    req.totalPeriodSec = *VAL;
  }

  return true;
}

/// User-facing wording for schedule errors.
const char* describe(smp::ScheduleStatus status) {
  switch (status) {
  case smp::ScheduleStatus::INVALID_DELAY:
    return "--delay must be at least 0.01 seconds";
  case smp::ScheduleStatus::INVALID_COUNT:
    return "--count must be a positive integer";
  case smp::ScheduleStatus::INVALID_PERIOD:
    return "--period must cover at least one delay";
  case smp::ScheduleStatus::CONFLICTING_LIMITS:
    return "--count and --period cannot be combined";
  case smp::ScheduleStatus::OK:
    break;
  }
  return smp::toString(status);
}

/* ----------------------------- Signal Handling ----------------------------- */

std::atomic<bool> gStopRequested{false};

void signalHandler(int /*signum*/) { gStopRequested.store(true); }

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP, stderr);
    return EXIT_USAGE;
  }

  if (pargs.count(ARG_HELP) != 0) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_OK;
  }

  smp::ScheduleRequest request;
  if (!buildRequest(pargs, request, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP, stderr);
    return EXIT_USAGE;
  }

  smp::SampleSchedule schedule;
  const smp::ScheduleStatus SCHED_STATUS = smp::resolveSchedule(request, schedule);
  if (SCHED_STATUS != smp::ScheduleStatus::OK) {
    fmt::print(stderr, "Error: {}\n\n", describe(SCHED_STATUS));
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP, stderr);
    return EXIT_USAGE;
  }

  // One-time discovery; neither value is re-read during the run
  mem::AccountingPolicy policy = mem::AccountingPolicy::HEURISTIC;
  if (mem::resolveAccountingPolicy(mem::OVERCOMMIT_MEMORY_PATH, policy) != mem::SourceStatus::OK) {
    fmt::print(stderr, "Error: cannot open '{}' (unsupported host)\n",
               mem::OVERCOMMIT_MEMORY_PATH);
    return EXIT_INTERFACE;
  }

  mem::NodeTopology topo;
  if (mem::discoverNodeTopology(mem::CPUINFO_PATH, topo) != mem::SourceStatus::OK) {
    fmt::print(stderr, "Error: cannot open '{}' (unsupported host)\n", mem::CPUINFO_PATH);
    return EXIT_INTERFACE;
  }

  const bool DEBUG_OUTPUT = (pargs.count(ARG_DEBUG) != 0);
  if (DEBUG_OUTPUT) {
    fmt::print(stderr, "[debug] {}\n", schedule.toString());
    fmt::print(stderr, "[debug] {}\n", topo.toString());
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  fmt::print("{}", rep::renderBanner(schedule.delaySec, schedule.repeatCount,
                                     schedule.totalPeriodSec, policy, topo.nodeCount));

  rep::ReportRenderer renderer(topo.nodeCount);
  const smp::SampleHooks HOOKS = smp::makeSystemHooks(mem::SnapshotSources{}, topo, policy);

  smp::SchedulerOptions options;
  options.debug = DEBUG_OUTPUT;
  options.stopFlag = &gStopRequested;

  const smp::RunResult RESULT = smp::runSampler(schedule, renderer, HOOKS, options);
  if (!RESULT.ok()) {
    fmt::print(stderr, "Error: {}: {}\n", mem::toString(RESULT.status), RESULT.error);
    return EXIT_INTERFACE;
  }

  if (DEBUG_OUTPUT) {
    fmt::print(stderr, "[debug] stopped: {} after {} rows\n", smp::toString(RESULT.reason),
               RESULT.rows);
  }

  return EXIT_OK;
}
