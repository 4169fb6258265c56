/**
 * @file ReportRenderer.cpp
 * @brief Implementation of the fixed-width memory report.
 */

#include "src/report/inc/ReportRenderer.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Units.hpp"

#include <time.h> // localtime_r

#include <ctime>            // std::time_t, std::tm
#include <initializer_list> // std::initializer_list

#include <fmt/core.h>
#include <fmt/format.h>

namespace memsampler {

namespace report {

using memsampler::helpers::clock::NS_PER_MS;
using memsampler::helpers::clock::NS_PER_SEC;
using memsampler::helpers::units::kibToMib;
using memsampler::helpers::units::REPORT_UNIT;

namespace {

/// Global column labels, in row order.
constexpr const char* GLOBAL_COLUMNS[] = {
    "Total", "Used",  "Free",      "Cached", "Buffers", "Slab", "CommittedAS",
    "CommitLimit", "Dirty", "Writeback", "Anon", "Avail",
};

inline void appendLabel(std::string& line, const std::string& label) {
  line += fmt::format("{:>{}}", label, COLUMN_WIDTH);
}

} // namespace

/* ----------------------------- Formatting ----------------------------- */

std::string formatTimestamp(std::uint64_t realtimeNs) {
  const std::time_t SECS = static_cast<std::time_t>(realtimeNs / NS_PER_SEC);
  const std::uint64_t MILLIS = (realtimeNs % NS_PER_SEC) / NS_PER_MS;

  std::tm local{};
  if (::localtime_r(&SECS, &local) == nullptr) {
    return fmt::format("{:-<{}}", "", TIMESTAMP_WIDTH);
  }

  return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}", local.tm_year + 1900,
                     local.tm_mon + 1, local.tm_mday, local.tm_hour, local.tm_min, local.tm_sec,
                     MILLIS);
}

std::string formatMibColumn(std::int64_t kib) {
  return fmt::format("{:>{}.1f}", kibToMib(kib), COLUMN_WIDTH);
}

/* ----------------------------- ReportRenderer Methods ----------------------------- */

std::string ReportRenderer::renderHeader() const {
  std::string line = fmt::format("{:<{}}", "Timestamp", TIMESTAMP_WIDTH);
  for (const char* label : GLOBAL_COLUMNS) {
    appendLabel(line, label);
  }
  for (std::size_t i = 0; i < nodeCount_; ++i) {
    appendLabel(line, fmt::format("{}:Avail", i));
    appendLabel(line, fmt::format("{}:HFree", i));
  }
  line += '\n';
  return line;
}

std::string ReportRenderer::renderData(const memory::MemorySnapshot& snap) const {
  std::string line = formatTimestamp(snap.timestampNs);
  line.reserve(TIMESTAMP_WIDTH + COLUMN_WIDTH * (12 + 2 * nodeCount_) + 1);

  const auto APPEND_COUNTER = [&line](std::uint64_t kib) {
    line += formatMibColumn(static_cast<std::int64_t>(kib));
  };

  // Order matches GLOBAL_COLUMNS
  APPEND_COUNTER(snap.totalKib);
  line += formatMibColumn(snap.usedKib);
  for (const std::uint64_t KIB :
       {snap.freeKib, snap.cachedKib, snap.buffersKib, snap.slabKib, snap.committedAsKib,
        snap.commitLimitKib, snap.dirtyKib, snap.writebackKib, snap.anonKib}) {
    APPEND_COUNTER(KIB);
  }
  line += formatMibColumn(snap.availKib);

  // Snapshots from deriveSnapshot() carry exactly nodeCount_ entries
  for (std::size_t i = 0; i < nodeCount_ && i < snap.nodes.size(); ++i) {
    APPEND_COUNTER(snap.nodes[i].availKib);
    APPEND_COUNTER(snap.nodes[i].hugeFreeKib);
  }

  line += '\n';
  return line;
}

std::string ReportRenderer::renderRow(const memory::MemorySnapshot& snap) {
  std::string out;
  if (headerDue()) {
    out += renderHeader();
  }
  out += renderData(snap);
  ++rowCount_;
  return out;
}

/* ----------------------------- Banner ----------------------------- */

std::string renderBanner(double delaySec, std::uint64_t repeatCount, double totalPeriodSec,
                         memory::AccountingPolicy policy, std::size_t nodeCount) {
  return fmt::format("# delay={:.3f}s count={} period={:.3f}s accounting={} nodes={} unit={}\n",
                     delaySec, repeatCount, totalPeriodSec, memory::toString(policy), nodeCount,
                     REPORT_UNIT);
}

std::string renderCompletion(std::size_t rows) {
  return fmt::format("{} ({} samples)\n", COMPLETION_MARKER, rows);
}

} // namespace report

} // namespace memsampler
