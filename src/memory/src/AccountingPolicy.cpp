/**
 * @file AccountingPolicy.cpp
 * @brief Implementation of the accounting policy switch lookup.
 */

#include "src/memory/inc/AccountingPolicy.hpp"
#include "src/helpers/inc/Files.hpp"

#include <array>   // std::array
#include <cstdlib> // strtol

namespace memsampler {

namespace memory {

using memsampler::helpers::files::INT_READ_BUFFER_SIZE;
using memsampler::helpers::files::readFileToBuffer;

const char* toString(AccountingPolicy policy) noexcept {
  switch (policy) {
  case AccountingPolicy::HEURISTIC:
    return "heuristic";
  case AccountingPolicy::STRICT:
    return "strict";
  }
  return "unknown";
}

AccountingPolicy policyFromSwitch(const char* text) noexcept {
  if (text == nullptr) {
    return AccountingPolicy::HEURISTIC;
  }

  char* end = nullptr;
  const long VAL = std::strtol(text, &end, 10);
  if (end == text) {
    return AccountingPolicy::HEURISTIC;
  }

  return (VAL == OVERCOMMIT_STRICT_VALUE) ? AccountingPolicy::STRICT : AccountingPolicy::HEURISTIC;
}

SourceStatus resolveAccountingPolicy(const char* path, AccountingPolicy& out) noexcept {
  out = AccountingPolicy::HEURISTIC;

  std::array<char, INT_READ_BUFFER_SIZE> buf{};
  std::size_t len = 0;
  if (!readFileToBuffer(path, buf.data(), buf.size(), len)) {
    return SourceStatus::INTERFACE_UNAVAILABLE;
  }

  out = policyFromSwitch(buf.data());
  return SourceStatus::OK;
}

} // namespace memory

} // namespace memsampler
