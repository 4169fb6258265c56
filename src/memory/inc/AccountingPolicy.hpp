#ifndef MEMSAMPLER_MEMORY_ACCOUNTING_POLICY_HPP
#define MEMSAMPLER_MEMORY_ACCOUNTING_POLICY_HPP
/**
 * @file AccountingPolicy.hpp
 * @brief Strict vs. heuristic memory accounting, from the overcommit switch (Linux).
 * @note Linux-only. Reads /proc/sys/vm/overcommit_memory.
 *
 * Resolved once per process; the result never changes during a run.
 */

#include "src/memory/inc/MetricSource.hpp"

#include <cstdint> // std::uint8_t

namespace memsampler {

namespace memory {

/* ----------------------------- Constants ----------------------------- */

/// Default location of the overcommit switch.
inline constexpr const char* OVERCOMMIT_MEMORY_PATH = "/proc/sys/vm/overcommit_memory";

/// Switch value selecting strict accounting (OVERCOMMIT_NEVER).
inline constexpr long OVERCOMMIT_STRICT_VALUE = 2;

/* ----------------------------- AccountingPolicy ----------------------------- */

/**
 * @brief How global availability is derived.
 *
 *  - STRICT:    CommitLimit - Committed_AS
 *  - HEURISTIC: MemFree + Cached + Buffers + SReclaimable
 */
enum class AccountingPolicy : std::uint8_t {
  HEURISTIC = 0,
  STRICT,
};

/**
 * @brief Human-readable policy name ("strict" / "heuristic").
 */
[[nodiscard]] const char* toString(AccountingPolicy policy) noexcept;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Map switch text to a policy.
 * @param text Contents of the switch file.
 * @return STRICT only for the integer 2; HEURISTIC otherwise, including unparsable text.
 */
[[nodiscard]] AccountingPolicy policyFromSwitch(const char* text) noexcept;

/**
 * @brief Read the switch and resolve the policy.
 * @param path Switch path (normally OVERCOMMIT_MEMORY_PATH).
 * @param out Resolved policy (HEURISTIC on failure).
 * @return OK, or INTERFACE_UNAVAILABLE if the file cannot be opened.
 * @note RT-safe: Bounded read into a stack buffer.
 */
[[nodiscard]] SourceStatus resolveAccountingPolicy(const char* path,
                                                   AccountingPolicy& out) noexcept;

} // namespace memory

} // namespace memsampler

#endif // MEMSAMPLER_MEMORY_ACCOUNTING_POLICY_HPP
