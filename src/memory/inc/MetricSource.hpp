#ifndef MEMSAMPLER_MEMORY_METRIC_SOURCE_HPP
#define MEMSAMPLER_MEMORY_METRIC_SOURCE_HPP
/**
 * @file MetricSource.hpp
 * @brief Key/value parsing of kernel memory accounting interfaces (Linux).
 * @note Linux-only. Shapes follow /proc/meminfo and /sys/devices/system/node/nodeN/meminfo.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Two line shapes are supported:
 *  - Flat:        "MemTotal:       16303636 kB"
 *  - Node-scoped: "Node 0 MemTotal:       8151818 kB"
 *
 * Lines that match neither shape are skipped. NUL, ESC, FF, CR and BEL bytes
 * are removed from a line before it is matched.
 */

#include <cstdint>     // std::uint64_t
#include <functional>  // std::less
#include <map>         // std::map
#include <string>      // std::string
#include <string_view> // std::string_view

namespace memsampler {

namespace memory {

/* ----------------------------- SourceStatus ----------------------------- */

/**
 * @brief Status codes for interface reads and snapshot derivation.
 *
 * Every non-OK value is fatal to the sampler: the interfaces are expected
 * on any supported host, so nothing is retried or defaulted.
 */
enum class SourceStatus : std::uint8_t {
  OK = 0,
  INTERFACE_UNAVAILABLE, ///< A kernel pseudo-file could not be opened
  MISSING_FIELD,         ///< A required key was absent from an interface
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(SourceStatus status) noexcept;

/* ----------------------------- Types ----------------------------- */

/// Metric name to magnitude (kibibytes unless the key says otherwise).
using RawMetrics = std::map<std::string, std::uint64_t, std::less<>>;

/// Node id to that node's metrics.
using NodeRawMetrics = std::map<int, RawMetrics>;

/// One matched flat line.
struct FlatEntry {
  std::string key;
  std::uint64_t value{0};
};

/// One matched node-scoped line.
struct NodeEntry {
  int nodeId{-1};
  std::string key;
  std::uint64_t value{0};
};

/* ----------------------------- Line Parsing ----------------------------- */

/**
 * @brief Match "<key>:<whitespace><integer>" with an optional unit suffix.
 * @param line Raw line.
 * @param out Populated on match.
 * @return true if the line matched.
 * @note Keys never contain whitespace, so node-scoped lines do not match.
 */
[[nodiscard]] bool parseFlatLine(std::string_view line, FlatEntry& out);

/**
 * @brief Match "Node <nodeId> <key>: <integer>" with an optional unit suffix.
 * @param line Raw line.
 * @param out Populated on match.
 * @return true if the line matched.
 */
[[nodiscard]] bool parseNodeLine(std::string_view line, NodeEntry& out);

/* ----------------------------- API ----------------------------- */

/**
 * @brief Read a flat interface into a metric map.
 * @param path Interface path (e.g. /proc/meminfo).
 * @param out Cleared, then filled with every matched line; later duplicates win.
 * @return OK, or INTERFACE_UNAVAILABLE if the file cannot be opened.
 * @note NOT RT-safe: Allocates per line.
 */
[[nodiscard]] SourceStatus readFlatMetrics(const char* path, RawMetrics& out) noexcept;

/**
 * @brief Read a node-scoped interface into a nested metric map.
 * @param path Interface path (e.g. /sys/devices/system/node/node0/meminfo).
 * @param out Cleared, then filled as nodeId -> key -> value.
 * @return OK, or INTERFACE_UNAVAILABLE if the file cannot be opened.
 * @note NOT RT-safe: Allocates per line.
 */
[[nodiscard]] SourceStatus readNodeMetrics(const char* path, NodeRawMetrics& out) noexcept;

} // namespace memory

} // namespace memsampler

#endif // MEMSAMPLER_MEMORY_METRIC_SOURCE_HPP
