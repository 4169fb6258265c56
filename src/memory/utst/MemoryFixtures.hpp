#ifndef MEMSAMPLER_MEMORY_UTST_MEMORY_FIXTURES_HPP
#define MEMSAMPLER_MEMORY_UTST_MEMORY_FIXTURES_HPP
/**
 * @file MemoryFixtures.hpp
 * @brief Shared kernel-interface fixtures for unit tests.
 *
 * The global fixture is the reference host used throughout the tests:
 * heuristic Avail = 570000 kB, strict Avail = 400000 kB, Total = 1000000 kB.
 */

#include "src/memory/inc/MetricSource.hpp"

#include <stdlib.h> // mkdtemp

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace memsampler {
namespace memory {
namespace fixtures {

/* ----------------------------- Interface Text ----------------------------- */

inline constexpr std::string_view GLOBAL_MEMINFO = "MemTotal:        1000000 kB\n"
                                                   "MemFree:          200000 kB\n"
                                                   "MemAvailable:     650000 kB\n"
                                                   "Buffers:           50000 kB\n"
                                                   "Cached:           300000 kB\n"
                                                   "SwapCached:            0 kB\n"
                                                   "Dirty:              1000 kB\n"
                                                   "Writeback:           500 kB\n"
                                                   "AnonPages:        100000 kB\n"
                                                   "Slab:              40000 kB\n"
                                                   "SReclaimable:      20000 kB\n"
                                                   "SUnreclaim:        20000 kB\n"
                                                   "CommitLimit:      900000 kB\n"
                                                   "Committed_AS:     500000 kB\n"
                                                   "HugePages_Total:      20\n"
                                                   "HugePages_Free:       10\n"
                                                   "Hugepagesize:       2048 kB\n";

inline constexpr std::string_view NODE0_MEMINFO = "Node 0 MemTotal:       500000 kB\n"
                                                  "Node 0 MemFree:        120000 kB\n"
                                                  "Node 0 FilePages:      150000 kB\n"
                                                  "Node 0 SReclaimable:     8000 kB\n"
                                                  "Node 0 HugePages_Total:    10\n"
                                                  "Node 0 HugePages_Free:      6\n";

inline constexpr std::string_view NODE1_MEMINFO = "Node 1 MemTotal:       500000 kB\n"
                                                  "Node 1 MemFree:         80000 kB\n"
                                                  "Node 1 FilePages:      140000 kB\n"
                                                  "Node 1 SReclaimable:    12000 kB\n"
                                                  "Node 1 HugePages_Total:    10\n"
                                                  "Node 1 HugePages_Free:      4\n";

/* ----------------------------- In-Memory Metrics ----------------------------- */

/// Global metrics matching GLOBAL_MEMINFO's required keys.
inline RawMetrics globalMetrics() {
  return RawMetrics{
      {"MemTotal", 1'000'000},  {"MemFree", 200'000},      {"Cached", 300'000},
      {"Buffers", 50'000},      {"SReclaimable", 20'000},  {"AnonPages", 100'000},
      {"Committed_AS", 500'000}, {"CommitLimit", 900'000}, {"Dirty", 1'000},
      {"Writeback", 500},       {"Slab", 40'000},          {"Hugepagesize", 2'048},
      {"HugePages_Free", 10},
  };
}

/// Node metrics matching NODE0_MEMINFO and NODE1_MEMINFO.
inline NodeRawMetrics nodeMetrics() {
  NodeRawMetrics nodes;
  nodes[0] = RawMetrics{
      {"MemFree", 120'000}, {"FilePages", 150'000}, {"SReclaimable", 8'000}, {"HugePages_Free", 6}};
  nodes[1] = RawMetrics{
      {"MemFree", 80'000}, {"FilePages", 140'000}, {"SReclaimable", 12'000}, {"HugePages_Free", 4}};
  return nodes;
}

/* ----------------------------- TempDir ----------------------------- */

/**
 * @brief Scratch directory under /tmp, removed on destruction.
 */
class TempDir {
public:
  TempDir() {
    char tmpl[] = "/tmp/memsampler_uTest_XXXXXX";
    const char* made = ::mkdtemp(tmpl);
    path_ = (made != nullptr) ? made : "";
  }

  ~TempDir() {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] bool valid() const noexcept { return !path_.empty(); }

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  /// Write contents to <dir>/<relative>, creating parent directories.
  std::string write(const std::string& relative, std::string_view contents) const {
    const std::filesystem::path FULL = std::filesystem::path(path_) / relative;
    std::error_code ec;
    std::filesystem::create_directories(FULL.parent_path(), ec);
    std::ofstream file(FULL, std::ios::binary | std::ios::trunc);
    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    return FULL.string();
  }

private:
  std::string path_;
};

} // namespace fixtures
} // namespace memory
} // namespace memsampler

#endif // MEMSAMPLER_MEMORY_UTST_MEMORY_FIXTURES_HPP
