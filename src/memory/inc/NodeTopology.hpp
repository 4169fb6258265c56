#ifndef MEMSAMPLER_MEMORY_NODE_TOPOLOGY_HPP
#define MEMSAMPLER_MEMORY_NODE_TOPOLOGY_HPP
/**
 * @file NodeTopology.hpp
 * @brief Node count discovery from CPU socket identifiers (Linux).
 * @note Linux-only. Reads /proc/cpuinfo.
 *
 * The node count is the number of distinct "physical id" values across all
 * logical processors. Nodes are then addressed as 0 .. nodeCount-1.
 *
 * @warning Socket count is used as the NUMA node count. Hosts with sub-NUMA
 *          clustering or memory-only nodes have more nodes than sockets, and
 *          hosts without the field report 0 nodes.
 */

#include "src/memory/inc/MetricSource.hpp"

#include <cstddef>     // std::size_t
#include <string>      // std::string
#include <string_view> // std::string_view

namespace memsampler {

namespace memory {

/* ----------------------------- Constants ----------------------------- */

/// Default CPU description interface.
inline constexpr const char* CPUINFO_PATH = "/proc/cpuinfo";

/// Directory holding per-node interfaces (nodeN/meminfo).
inline constexpr const char* NODE_SYSFS_DIR = "/sys/devices/system/node";

/* ----------------------------- NodeTopology ----------------------------- */

/**
 * @brief Node set discovered at startup; immutable afterwards.
 */
struct NodeTopology {
  std::size_t nodeCount{0}; ///< Distinct physical ids; 0 if the field is absent

  /// @brief Check if more than one node is present.
  [[nodiscard]] bool isNuma() const noexcept { return nodeCount > 1; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Match a "physical id<ws>: <int>" line.
 * @param line Raw cpuinfo line.
 * @param id Parsed identifier on match.
 * @return true if the line carries a physical id.
 */
[[nodiscard]] bool parsePhysicalIdLine(std::string_view line, int& id) noexcept;

/**
 * @brief Count distinct physical ids in cpuinfo text.
 * @param text Full cpuinfo contents.
 * @return Number of distinct ids (0 if none).
 */
[[nodiscard]] std::size_t countPhysicalIds(std::string_view text);

/* ----------------------------- API ----------------------------- */

/**
 * @brief Discover the node count from a cpuinfo interface.
 * @param path Interface path (normally CPUINFO_PATH).
 * @param out Populated topology (nodeCount=0 on failure).
 * @return OK, or INTERFACE_UNAVAILABLE if the file cannot be opened.
 * @note NOT RT-safe: File size scales with core count.
 */
[[nodiscard]] SourceStatus discoverNodeTopology(const char* path, NodeTopology& out) noexcept;

} // namespace memory

} // namespace memsampler

#endif // MEMSAMPLER_MEMORY_NODE_TOPOLOGY_HPP
