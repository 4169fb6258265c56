#ifndef MEMSAMPLER_HELPERS_STRINGS_HPP
#define MEMSAMPLER_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for parsing kernel text interfaces.
 *
 * Small, allocation-light utilities shared by the /proc and /sys line parsers.
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtoull
#include <cstring> // strlen, strncmp
#include <string>
#include <string_view>

namespace memsampler {
namespace helpers {
namespace strings {

/* ----------------------------- Classification ----------------------------- */

/// True for the blank characters that separate fields in kernel text files.
[[nodiscard]] inline constexpr bool isBlank(char c) noexcept { return c == ' ' || c == '\t'; }

/// True for the control bytes stripped from kernel lines before matching.
[[nodiscard]] inline constexpr bool isStrippedControl(char c) noexcept {
  return c == '\0' || c == '\x1b' || c == '\f' || c == '\r' || c == '\a';
}

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Skip leading whitespace (spaces and tabs).
 * @param text View into a line.
 * @return Suffix of text starting at the first non-blank character.
 */
[[nodiscard]] inline std::string_view skipWhitespace(std::string_view text) noexcept {
  std::size_t i = 0;
  while (i < text.size() && isBlank(text[i])) {
    ++i;
  }
  return text.substr(i);
}

/**
 * @brief Parse a leading unsigned decimal integer.
 * @param text View positioned at the first digit.
 * @param value Output value (unchanged on failure).
 * @param consumed Output count of characters consumed.
 * @return true if at least one digit was parsed.
 *
 * Signs are rejected; strtoull alone would accept "-1".
 */
[[nodiscard]] inline bool parseUint(std::string_view text, std::uint64_t& value,
                                    std::size_t& consumed) noexcept {
  if (text.empty() || text[0] < '0' || text[0] > '9') {
    return false;
  }

  std::size_t len = 0;
  while (len < text.size() && text[len] >= '0' && text[len] <= '9') {
    ++len;
  }

  // strtoull needs a terminated copy; kernel values fit in 20 digits
  char buf[32]{};
  if (len >= sizeof(buf)) {
    return false;
  }
  std::memcpy(buf, text.data(), len);

  char* end = nullptr;
  const unsigned long long VAL = std::strtoull(buf, &end, 10);
  if (end != buf + len) {
    return false;
  }

  value = static_cast<std::uint64_t>(VAL);
  consumed = len;
  return true;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Copy a line with NUL, ESC, FF, CR and BEL bytes removed.
 * @param line Raw line as read from the interface.
 * @return Cleaned copy.
 */
[[nodiscard]] inline std::string stripControlChars(std::string_view line) {
  std::string out;
  out.reserve(line.size());
  for (const char C : line) {
    if (!isStrippedControl(C)) {
      out.push_back(C);
    }
  }
  return out;
}

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

/**
 * @brief Check if a view starts with prefix.
 */
[[nodiscard]] inline bool startsWith(std::string_view text, std::string_view prefix) noexcept {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace strings
} // namespace helpers
} // namespace memsampler

#endif // MEMSAMPLER_HELPERS_STRINGS_HPP
