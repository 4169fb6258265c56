#ifndef MEMSAMPLER_REPORT_REPORT_RENDERER_HPP
#define MEMSAMPLER_REPORT_REPORT_RENDERER_HPP
/**
 * @file ReportRenderer.hpp
 * @brief Fixed-width time-series rows for memory snapshots.
 *
 * Row layout:
 *   Timestamp Total Used Free Cached Buffers Slab CommittedAS CommitLimit
 *   Dirty Writeback Anon Avail [<id>:Avail <id>:HFree]...
 *
 * Values are mebibytes with one decimal. A header precedes row 1 and every
 * HEADER_INTERVAL rows after it.
 *
 * @note NOT RT-safe: All rendering returns std::string.
 */

#include "src/memory/inc/AccountingPolicy.hpp"
#include "src/memory/inc/MemorySnapshot.hpp"

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t
#include <string>  // std::string

namespace memsampler {

namespace report {

/* ----------------------------- Constants ----------------------------- */

/// Rows between header re-emissions.
inline constexpr std::size_t HEADER_INTERVAL = 15;

/// Width of every metric column.
inline constexpr std::size_t COLUMN_WIDTH = 12;

/// Width of "YYYY-MM-DD HH:MM:SS.mmm".
inline constexpr std::size_t TIMESTAMP_WIDTH = 23;

/// Completion marker prefix.
inline constexpr const char* COMPLETION_MARKER = "# sampling complete";

/* ----------------------------- Formatting ----------------------------- */

/**
 * @brief Format a wall-clock timestamp as local "YYYY-MM-DD HH:MM:SS.mmm".
 * @param realtimeNs Nanoseconds since the epoch.
 */
[[nodiscard]] std::string formatTimestamp(std::uint64_t realtimeNs);

/**
 * @brief Format a kibibyte value as a right-aligned mebibyte column.
 * @note Negative values render with a leading minus sign.
 */
[[nodiscard]] std::string formatMibColumn(std::int64_t kib);

/* ----------------------------- ReportRenderer ----------------------------- */

/**
 * @brief Renders snapshot rows and decides when the header repeats.
 *
 * The row counter is the only state carried across samples.
 */
class ReportRenderer {
public:
  /// @param nodeCount Number of node column pairs in every row.
  explicit ReportRenderer(std::size_t nodeCount) noexcept : nodeCount_(nodeCount) {}

  /// @brief Header line (with trailing newline).
  [[nodiscard]] std::string renderHeader() const;

  /// @brief Data line for a snapshot (with trailing newline); does not count.
  [[nodiscard]] std::string renderData(const memory::MemorySnapshot& snap) const;

  /**
   * @brief Header when due, then the data line; advances the row counter.
   * @param snap Snapshot with timestampNs set.
   */
  [[nodiscard]] std::string renderRow(const memory::MemorySnapshot& snap);

  /// @brief True if the next renderRow() will emit a header.
  [[nodiscard]] bool headerDue() const noexcept { return rowCount_ % HEADER_INTERVAL == 0; }

  /// @brief Rows rendered so far.
  [[nodiscard]] std::size_t rowCount() const noexcept { return rowCount_; }

  [[nodiscard]] std::size_t nodeCount() const noexcept { return nodeCount_; }

private:
  std::size_t nodeCount_{0};
  std::size_t rowCount_{0};
};

/* ----------------------------- Banner ----------------------------- */

/**
 * @brief Startup banner stating the resolved configuration.
 * @param delaySec Seconds between samples.
 * @param repeatCount Number of samples.
 * @param totalPeriodSec Total sampling period in seconds.
 * @param policy Accounting policy in effect.
 * @param nodeCount Discovered node count.
 */
[[nodiscard]] std::string renderBanner(double delaySec, std::uint64_t repeatCount,
                                       double totalPeriodSec, memory::AccountingPolicy policy,
                                       std::size_t nodeCount);

/**
 * @brief Completion marker emitted once the loop is done.
 * @param rows Rows rendered during the run.
 */
[[nodiscard]] std::string renderCompletion(std::size_t rows);

} // namespace report

} // namespace memsampler

#endif // MEMSAMPLER_REPORT_REPORT_RENDERER_HPP
