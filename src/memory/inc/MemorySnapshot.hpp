#ifndef MEMSAMPLER_MEMORY_MEMORY_SNAPSHOT_HPP
#define MEMSAMPLER_MEMORY_MEMORY_SNAPSHOT_HPP
/**
 * @file MemorySnapshot.hpp
 * @brief Per-sample memory model: global availability plus per-node state (Linux).
 * @note Linux-only. Reads /proc/meminfo and /sys/devices/system/node/nodeN/meminfo.
 *
 * All fields are kibibytes. Derivation is integer-only; conversion to larger
 * units happens at render time.
 */

#include "src/memory/inc/AccountingPolicy.hpp"
#include "src/memory/inc/MetricSource.hpp"
#include "src/memory/inc/NodeTopology.hpp"

#include <cstddef>     // std::size_t
#include <cstdint>     // std::int64_t, std::uint64_t
#include <functional>  // std::reference_wrapper
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace memsampler {

namespace memory {

/* ----------------------------- Constants ----------------------------- */

/// Default global memory interface.
inline constexpr const char* MEMINFO_PATH = "/proc/meminfo";

/// Global keys every sample requires.
inline constexpr std::string_view REQUIRED_GLOBAL_KEYS[] = {
    "MemTotal",    "MemFree",   "Cached",    "Buffers",      "Slab",
    "Committed_AS", "CommitLimit", "Dirty",  "Writeback",    "AnonPages",
    "SReclaimable", "Hugepagesize", "HugePages_Free",
};

/// Keys every node interface requires.
inline constexpr std::string_view REQUIRED_NODE_KEYS[] = {
    "MemFree",
    "FilePages",
    "SReclaimable",
    "HugePages_Free",
};

/* ----------------------------- NodeMemory ----------------------------- */

/**
 * @brief Derived state of a single node.
 */
struct NodeMemory {
  int nodeId{-1};              ///< Node id (0-based)
  std::uint64_t availKib{0};   ///< MemFree + FilePages + SReclaimable
  std::uint64_t hugeFreeKib{0}; ///< HugePages_Free * global Hugepagesize
};

/* ----------------------------- MemorySnapshot ----------------------------- */

/**
 * @brief Derived, sample-scoped memory record.
 *
 * Invariant: usedKib == totalKib - availKib.
 *
 * Avail and Used are signed. Strict accounting on a host with large swap can
 * report Avail above Total (negative Used), and an over-committed host reports
 * negative Avail.
 */
struct MemorySnapshot {
  std::uint64_t totalKib{0};       ///< MemTotal
  std::int64_t usedKib{0};         ///< Total - Avail (may be negative)
  std::uint64_t freeKib{0};        ///< MemFree
  std::uint64_t cachedKib{0};      ///< Cached
  std::uint64_t buffersKib{0};     ///< Buffers
  std::uint64_t slabKib{0};        ///< Slab
  std::uint64_t committedAsKib{0}; ///< Committed_AS
  std::uint64_t commitLimitKib{0}; ///< CommitLimit
  std::uint64_t dirtyKib{0};       ///< Dirty
  std::uint64_t writebackKib{0};   ///< Writeback
  std::uint64_t anonKib{0};        ///< AnonPages
  std::int64_t availKib{0};        ///< Policy-dependent availability (may be negative)

  std::vector<NodeMemory> nodes{}; ///< Ascending node id order

  std::uint64_t timestampNs{0}; ///< Wall-clock capture time, set by the scheduler
};

/* ----------------------------- SnapshotSources ----------------------------- */

/**
 * @brief Interface locations read by the builder.
 *
 * Defaults point at the live kernel; tests point them at fixtures.
 */
struct SnapshotSources {
  std::string meminfoPath{MEMINFO_PATH}; ///< Flat global interface
  std::string nodeDir{NODE_SYSFS_DIR};   ///< Contains nodeN/meminfo

  /// @brief Path of the node-scoped interface for nodeId.
  [[nodiscard]] std::string nodeMeminfoPath(int nodeId) const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Derive a snapshot from already-read metrics.
 * @param global Flat metrics from the global interface.
 * @param nodes Node-scoped metrics; must contain ids 0 .. nodeCount-1.
 * @param nodeCount Number of nodes to derive.
 * @param policy Accounting policy for global Avail.
 * @param out Populated only on OK (timestampNs untouched).
 * @param error Optional target naming the missing key.
 * @return OK or MISSING_FIELD.
 * @note Pure: no I/O.
 */
[[nodiscard]] SourceStatus
deriveSnapshot(const RawMetrics& global, const NodeRawMetrics& nodes, std::size_t nodeCount,
               AccountingPolicy policy, MemorySnapshot& out,
               std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept;

/**
 * @brief Read all interfaces for one sample and derive the snapshot.
 * @param sources Interface locations.
 * @param topo Node topology discovered at startup.
 * @param policy Accounting policy resolved at startup.
 * @param out Populated only on OK.
 * @param error Optional target naming the failed path or missing key.
 * @return OK, INTERFACE_UNAVAILABLE or MISSING_FIELD.
 * @note NOT RT-safe: One file read per node plus the global read.
 */
[[nodiscard]] SourceStatus
buildSnapshot(const SnapshotSources& sources, const NodeTopology& topo, AccountingPolicy policy,
              MemorySnapshot& out,
              std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept;

} // namespace memory

} // namespace memsampler

#endif // MEMSAMPLER_MEMORY_MEMORY_SNAPSHOT_HPP
