#ifndef MEMSAMPLER_HELPERS_UNITS_HPP
#define MEMSAMPLER_HELPERS_UNITS_HPP
/**
 * @file Units.hpp
 * @brief Binary unit constants and kibibyte conversions.
 *
 * All stored and derived memory values are kibibytes, the unit of the kernel
 * interfaces. Conversion to larger units happens only when rendering.
 */

#include <cstdint>

namespace memsampler {
namespace helpers {
namespace units {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::uint64_t KIB = 1024ULL;
inline constexpr std::uint64_t MIB = KIB * 1024ULL;

/// Kibibytes per mebibyte.
inline constexpr std::uint64_t KIB_PER_MIB = MIB / KIB;

/// Label of the unit used by report rows.
inline constexpr const char* REPORT_UNIT = "MiB";

/* ----------------------------- API ----------------------------- */

/// Kibibytes to mebibytes.
[[nodiscard]] inline constexpr double kibToMib(std::int64_t kib) noexcept {
  return static_cast<double>(kib) / static_cast<double>(KIB_PER_MIB);
}

} // namespace units
} // namespace helpers
} // namespace memsampler

#endif // MEMSAMPLER_HELPERS_UNITS_HPP
