#ifndef MEMSAMPLER_HELPERS_FILES_HPP
#define MEMSAMPLER_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Scoped reads of kernel pseudo-files.
 *
 * Every reader opens, consumes and closes the file within one call; nothing
 * is held open between samples. Open failures are reported to the caller,
 * which decides whether they are fatal.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>  // open, O_RDONLY, O_CLOEXEC
#include <unistd.h> // read, close

#include <cstddef>
#include <fstream>
#include <string>

namespace memsampler {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Buffer size for single-value switch files.
inline constexpr std::size_t INT_READ_BUFFER_SIZE = 64;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer (always null-terminated).
 * @param bufSize Size of output buffer.
 * @param len Output: bytes read, trailing whitespace stripped.
 * @return false if the file could not be opened.
 *
 * An empty file opens successfully and yields len == 0.
 */
[[nodiscard]] inline bool readFileToBuffer(const char* path, char* buf, std::size_t bufSize,
                                           std::size_t& len) noexcept {
  len = 0;
  if (buf == nullptr || bufSize == 0) {
    return false;
  }
  buf[0] = '\0';
  if (path == nullptr) {
    return false;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  strings::stripTrailingWhitespace(buf, total);
  len = total;
  return true;
}

/**
 * @brief Invoke fn(const std::string&) for every line of a text file.
 * @param path File path to read.
 * @param fn Line callback; lines exclude the trailing newline.
 * @return false if the file could not be opened.
 * @note Used for interfaces whose size scales with the host (cpuinfo, meminfo).
 */
template <typename Fn> [[nodiscard]] inline bool forEachLine(const char* path, Fn&& fn) {
  std::ifstream file(path);
  if (!file) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    fn(static_cast<const std::string&>(line));
  }
  return true;
}

} // namespace files
} // namespace helpers
} // namespace memsampler

#endif // MEMSAMPLER_HELPERS_FILES_HPP
