/**
 * @file NodeTopology.cpp
 * @brief Implementation of node count discovery from /proc/cpuinfo.
 */

#include "src/memory/inc/NodeTopology.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <climits> // INT_MAX
#include <set>     // std::set

#include <fmt/core.h>

namespace memsampler {

namespace memory {

using memsampler::helpers::files::forEachLine;
using memsampler::helpers::strings::parseUint;
using memsampler::helpers::strings::skipWhitespace;
using memsampler::helpers::strings::startsWith;

namespace {

/// Adds the line's physical id to the set, if the line carries one.
void collectPhysicalId(std::string_view line, std::set<int>& ids) {
  int id = -1;
  if (parsePhysicalIdLine(line, id)) {
    ids.insert(id);
  }
}

} // namespace

/* ----------------------------- NodeTopology Methods ----------------------------- */

std::string NodeTopology::toString() const {
  if (nodeCount == 0) {
    return "Nodes: none reported (no per-node columns)";
  }
  return fmt::format("Nodes: {} ({})", nodeCount, isNuma() ? "NUMA" : "single node");
}

/* ----------------------------- Parsing ----------------------------- */

bool parsePhysicalIdLine(std::string_view line, int& id) noexcept {
  constexpr std::string_view FIELD = "physical id";
  if (!startsWith(line, FIELD)) {
    return false;
  }

  // cpuinfo pads field names with tabs before the colon
  std::string_view rest = skipWhitespace(line.substr(FIELD.size()));
  if (rest.empty() || rest[0] != ':') {
    return false;
  }
  rest = skipWhitespace(rest.substr(1));

  std::uint64_t val = 0;
  std::size_t consumed = 0;
  if (!parseUint(rest, val, consumed) || val > static_cast<std::uint64_t>(INT_MAX)) {
    return false;
  }

  id = static_cast<int>(val);
  return true;
}

std::size_t countPhysicalIds(std::string_view text) {
  std::set<int> ids;

  while (!text.empty()) {
    const std::size_t EOL = text.find('\n');
    collectPhysicalId(text.substr(0, EOL), ids);

    if (EOL == std::string_view::npos) {
      break;
    }
    text.remove_prefix(EOL + 1);
  }

  return ids.size();
}

/* ----------------------------- API ----------------------------- */

SourceStatus discoverNodeTopology(const char* path, NodeTopology& out) noexcept {
  out = NodeTopology{};

  std::set<int> ids;
  const bool OPENED =
      forEachLine(path, [&ids](const std::string& line) { collectPhysicalId(line, ids); });
  if (!OPENED) {
    return SourceStatus::INTERFACE_UNAVAILABLE;
  }

  out.nodeCount = ids.size();
  return SourceStatus::OK;
}

} // namespace memory

} // namespace memsampler
