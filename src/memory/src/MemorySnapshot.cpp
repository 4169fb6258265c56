/**
 * @file MemorySnapshot.cpp
 * @brief Implementation of snapshot building and availability derivation.
 */

#include "src/memory/inc/MemorySnapshot.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace memsampler {

namespace memory {

namespace {

/* ----------------------------- Lookup Helpers ----------------------------- */

/// Kernel counter as a signed kibibyte value.
inline std::int64_t toSigned(std::uint64_t kib) noexcept { return static_cast<std::int64_t>(kib); }

/// Value of a key already checked by findMissingKey().
inline std::uint64_t valueOf(const RawMetrics& metrics, std::string_view key) noexcept {
  const auto IT = metrics.find(key);
  return (IT != metrics.end()) ? IT->second : 0;
}

/// First required key absent from metrics, or empty view when all are present.
template <std::size_t N>
inline std::string_view findMissingKey(const RawMetrics& metrics,
                                       const std::string_view (&keys)[N]) noexcept {
  for (const std::string_view KEY : keys) {
    if (metrics.find(KEY) == metrics.end()) {
      return KEY;
    }
  }
  return {};
}

inline void setError(std::optional<std::reference_wrapper<std::string>>& error,
                     std::string msg) noexcept {
  if (error) {
    error->get() = std::move(msg);
  }
}

/// Global Avail under the given policy.
inline std::int64_t deriveAvail(const RawMetrics& global, AccountingPolicy policy) noexcept {
  if (policy == AccountingPolicy::STRICT) {
    // Negative when Committed_AS exceeds CommitLimit
    return toSigned(valueOf(global, "CommitLimit")) - toSigned(valueOf(global, "Committed_AS"));
  }
  return toSigned(valueOf(global, "MemFree") + valueOf(global, "Cached") +
                  valueOf(global, "Buffers") + valueOf(global, "SReclaimable"));
}

} // namespace

/* ----------------------------- SnapshotSources Methods ----------------------------- */

std::string SnapshotSources::nodeMeminfoPath(int nodeId) const {
  return fmt::format("{}/node{}/meminfo", nodeDir, nodeId);
}

/* ----------------------------- API ----------------------------- */

SourceStatus deriveSnapshot(const RawMetrics& global, const NodeRawMetrics& nodes,
                            std::size_t nodeCount, AccountingPolicy policy, MemorySnapshot& out,
                            std::optional<std::reference_wrapper<std::string>> error) noexcept {
  const std::string_view MISSING = findMissingKey(global, REQUIRED_GLOBAL_KEYS);
  if (!MISSING.empty()) {
    setError(error, fmt::format("global metric '{}' not reported", MISSING));
    return SourceStatus::MISSING_FIELD;
  }

  MemorySnapshot snap{};
  snap.totalKib = valueOf(global, "MemTotal");
  snap.freeKib = valueOf(global, "MemFree");
  snap.cachedKib = valueOf(global, "Cached");
  snap.buffersKib = valueOf(global, "Buffers");
  snap.slabKib = valueOf(global, "Slab");
  snap.committedAsKib = valueOf(global, "Committed_AS");
  snap.commitLimitKib = valueOf(global, "CommitLimit");
  snap.dirtyKib = valueOf(global, "Dirty");
  snap.writebackKib = valueOf(global, "Writeback");
  snap.anonKib = valueOf(global, "AnonPages");
  snap.availKib = deriveAvail(global, policy);
  snap.usedKib = toSigned(snap.totalKib) - snap.availKib;

  // Huge page size is global; applied uniformly to every node
  const std::uint64_t HUGE_PAGE_KIB = valueOf(global, "Hugepagesize");

  snap.nodes.reserve(nodeCount);
  for (std::size_t i = 0; i < nodeCount; ++i) {
    const int NODE_ID = static_cast<int>(i);
    const auto IT = nodes.find(NODE_ID);
    if (IT == nodes.end()) {
      setError(error, fmt::format("node {} not reported", NODE_ID));
      return SourceStatus::MISSING_FIELD;
    }

    const RawMetrics& NODE = IT->second;
    const std::string_view NODE_MISSING = findMissingKey(NODE, REQUIRED_NODE_KEYS);
    if (!NODE_MISSING.empty()) {
      setError(error, fmt::format("node {} metric '{}' not reported", NODE_ID, NODE_MISSING));
      return SourceStatus::MISSING_FIELD;
    }

    // Node interfaces expose FilePages where the global one exposes Cached
    NodeMemory node{};
    node.nodeId = NODE_ID;
    node.availKib = valueOf(NODE, "MemFree") + valueOf(NODE, "FilePages") +
                    valueOf(NODE, "SReclaimable");
    node.hugeFreeKib = valueOf(NODE, "HugePages_Free") * HUGE_PAGE_KIB;
    snap.nodes.push_back(node);
  }

  snap.timestampNs = out.timestampNs;
  out = std::move(snap);
  return SourceStatus::OK;
}

SourceStatus buildSnapshot(const SnapshotSources& sources, const NodeTopology& topo,
                           AccountingPolicy policy, MemorySnapshot& out,
                           std::optional<std::reference_wrapper<std::string>> error) noexcept {
  RawMetrics global;
  if (readFlatMetrics(sources.meminfoPath.c_str(), global) != SourceStatus::OK) {
    setError(error, fmt::format("cannot open '{}'", sources.meminfoPath));
    return SourceStatus::INTERFACE_UNAVAILABLE;
  }

  NodeRawMetrics nodes;
  NodeRawMetrics nodeRead;
  for (std::size_t i = 0; i < topo.nodeCount; ++i) {
    const std::string PATH = sources.nodeMeminfoPath(static_cast<int>(i));
    if (readNodeMetrics(PATH.c_str(), nodeRead) != SourceStatus::OK) {
      setError(error, fmt::format("cannot open '{}'", PATH));
      return SourceStatus::INTERFACE_UNAVAILABLE;
    }

    // Each node file only describes its own node
    const auto IT = nodeRead.find(static_cast<int>(i));
    if (IT != nodeRead.end()) {
      nodes[IT->first] = std::move(IT->second);
    }
  }

  return deriveSnapshot(global, nodes, topo.nodeCount, policy, out, error);
}

} // namespace memory

} // namespace memsampler
