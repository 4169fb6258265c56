#ifndef MEMSAMPLER_HELPERS_ARGS_HPP
#define MEMSAMPLER_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parser plus strict numeric conversions for flag values.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <cerrno>
#include <cmath>   // std::isfinite
#include <cstdint>
#include <cstdio>  // std::FILE
#include <cstdlib> // strtod, strtoull
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace memsampler {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--delay"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/// Optional error message target.
using ErrorOut = std::optional<std::reference_wrapper<std::string>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * When a flag is matched it consumes the next nargs tokens literally as its
 * values. Tokens that match no flag are rejected.
 *
 * @param args   Argument list (non-owning views; must outlive pargs).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, ErrorOut error = std::nullopt) noexcept {
  auto fail = [&error](std::string msg) {
    if (error) {
      error->get() = std::move(msg);
    }
    return false;
  };

  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  byFlag.reserve(map.size());
  for (const auto& KV : map) {
    byFlag.emplace(KV.second.flag, KV.first);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = byFlag.find(args[i]);
    if (IT == byFlag.end()) {
      return fail(fmt::format("Unknown argument '{}'", args[i]));
    }

    const std::uint8_t KEY = IT->second;
    const ArgDef& DEF = map.at(KEY);
    if (i + DEF.nargs >= args.size()) {
      return fail(fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs));
    }

    std::vector<std::string_view>& out = pargs[KEY];
    out.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
               args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && pargs.count(KV.first) == 0) {
      return fail(fmt::format("Missing required argument '{}'", KV.second.flag));
    }
  }

  return true;
}

/**
 * @brief Parse a flag value as a finite double.
 * @return std::nullopt if the whole token is not a number.
 */
[[nodiscard]] inline std::optional<double> parseDouble(std::string_view token) noexcept {
  if (token.empty()) {
    return std::nullopt;
  }
  const std::string COPY(token);
  char* end = nullptr;
  errno = 0;
  const double VAL = std::strtod(COPY.c_str(), &end);
  if (errno != 0 || end != COPY.c_str() + COPY.size() || !std::isfinite(VAL)) {
    return std::nullopt;
  }
  return VAL;
}

/**
 * @brief Parse a flag value as an unsigned integer.
 * @return std::nullopt if the token has a sign, trailing text or overflows.
 */
[[nodiscard]] inline std::optional<std::uint64_t> parseUint(std::string_view token) noexcept {
  if (token.empty() || token[0] < '0' || token[0] > '9') {
    return std::nullopt;
  }
  const std::string COPY(token);
  char* end = nullptr;
  errno = 0;
  const unsigned long long VAL = std::strtoull(COPY.c_str(), &end, 10);
  if (errno != 0 || end != COPY.c_str() + COPY.size()) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(VAL);
}

/**
 * @brief Print usage information for a CLI tool.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @param out         Destination stream.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map,
                       std::FILE* out = stdout) noexcept {
  fmt::print(out, "Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print(out, "{}\n\n", description);
  }
  fmt::print(out, "Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : entries) {
    const std::string FLAG =
        def->nargs > 0 ? fmt::format("{} <value>", def->flag) : std::string(def->flag);
    fmt::print(out, "  {:<18}  {}{}\n", FLAG, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace memsampler

#endif // MEMSAMPLER_HELPERS_ARGS_HPP
