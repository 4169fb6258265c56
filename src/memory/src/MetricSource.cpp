/**
 * @file MetricSource.cpp
 * @brief Implementation of kernel key/value interface parsing.
 */

#include "src/memory/inc/MetricSource.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <climits> // INT_MAX
#include <utility> // std::move

namespace memsampler {

namespace memory {

using memsampler::helpers::files::forEachLine;
using memsampler::helpers::strings::isBlank;
using memsampler::helpers::strings::parseUint;
using memsampler::helpers::strings::skipWhitespace;
using memsampler::helpers::strings::startsWith;
using memsampler::helpers::strings::stripControlChars;

namespace {

/* ----------------------------- Matching ----------------------------- */

/// Match "<key>:<ws><int>..." on an already-cleaned view.
inline bool matchKeyValue(std::string_view text, std::string& key, std::uint64_t& value) {
  const std::size_t COLON = text.find(':');
  if (COLON == std::string_view::npos || COLON == 0) {
    return false;
  }

  const std::string_view KEY = text.substr(0, COLON);
  for (const char C : KEY) {
    if (isBlank(C)) {
      return false;
    }
  }

  // At least one blank must separate the colon from the number
  const std::string_view REST = text.substr(COLON + 1);
  if (REST.empty() || !isBlank(REST[0])) {
    return false;
  }

  std::uint64_t parsed = 0;
  std::size_t consumed = 0;
  if (!parseUint(skipWhitespace(REST), parsed, consumed)) {
    return false;
  }

  key.assign(KEY);
  value = parsed;
  return true;
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(SourceStatus status) noexcept {
  switch (status) {
  case SourceStatus::OK:
    return "OK";
  case SourceStatus::INTERFACE_UNAVAILABLE:
    return "INTERFACE_UNAVAILABLE";
  case SourceStatus::MISSING_FIELD:
    return "MISSING_FIELD";
  }
  return "UNKNOWN";
}

/* ----------------------------- Line Parsing ----------------------------- */

bool parseFlatLine(std::string_view line, FlatEntry& out) {
  const std::string CLEAN = stripControlChars(line);
  return matchKeyValue(CLEAN, out.key, out.value);
}

bool parseNodeLine(std::string_view line, NodeEntry& out) {
  const std::string CLEAN = stripControlChars(line);
  std::string_view text{CLEAN};

  constexpr std::string_view PREFIX = "Node";
  if (!startsWith(text, PREFIX)) {
    return false;
  }
  text.remove_prefix(PREFIX.size());
  if (text.empty() || !isBlank(text[0])) {
    return false;
  }
  text = skipWhitespace(text);

  std::uint64_t nodeId = 0;
  std::size_t consumed = 0;
  if (!parseUint(text, nodeId, consumed) || nodeId > static_cast<std::uint64_t>(INT_MAX)) {
    return false;
  }
  text.remove_prefix(consumed);
  if (text.empty() || !isBlank(text[0])) {
    return false;
  }

  std::string key;
  std::uint64_t value = 0;
  if (!matchKeyValue(skipWhitespace(text), key, value)) {
    return false;
  }

  out.nodeId = static_cast<int>(nodeId);
  out.key = std::move(key);
  out.value = value;
  return true;
}

/* ----------------------------- API ----------------------------- */

SourceStatus readFlatMetrics(const char* path, RawMetrics& out) noexcept {
  out.clear();

  FlatEntry entry;
  const bool OPENED = forEachLine(path, [&](const std::string& line) {
    if (parseFlatLine(line, entry)) {
      out[entry.key] = entry.value;
    }
  });

  return OPENED ? SourceStatus::OK : SourceStatus::INTERFACE_UNAVAILABLE;
}

SourceStatus readNodeMetrics(const char* path, NodeRawMetrics& out) noexcept {
  out.clear();

  NodeEntry entry;
  const bool OPENED = forEachLine(path, [&](const std::string& line) {
    if (parseNodeLine(line, entry)) {
      out[entry.nodeId][entry.key] = entry.value;
    }
  });

  return OPENED ? SourceStatus::OK : SourceStatus::INTERFACE_UNAVAILABLE;
}

} // namespace memory

} // namespace memsampler
