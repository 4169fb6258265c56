/**
 * @file MetricSource_uTest.cpp
 * @brief Unit tests for memsampler::memory metric source parsing.
 *
 * Notes:
 *  - Line parsers are tested directly; file readers use fixtures under /tmp.
 *  - A final test reads the live /proc/meminfo and asserts relations only.
 */

#include "src/memory/inc/MetricSource.hpp"
#include "src/memory/utst/MemoryFixtures.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using memsampler::memory::FlatEntry;
using memsampler::memory::NodeEntry;
using memsampler::memory::NodeRawMetrics;
using memsampler::memory::parseFlatLine;
using memsampler::memory::parseNodeLine;
using memsampler::memory::RawMetrics;
using memsampler::memory::readFlatMetrics;
using memsampler::memory::readNodeMetrics;
using memsampler::memory::SourceStatus;
using memsampler::memory::toString;
using memsampler::memory::fixtures::GLOBAL_MEMINFO;
using memsampler::memory::fixtures::NODE1_MEMINFO;
using memsampler::memory::fixtures::TempDir;

using namespace std::string_view_literals;

/* ----------------------------- Flat Line Tests ----------------------------- */

/** @test Standard meminfo line with unit suffix. */
TEST(ParseFlatLineTest, KeyValueWithUnit) {
  FlatEntry entry;
  ASSERT_TRUE(parseFlatLine("MemTotal:       16303636 kB", entry));
  EXPECT_EQ(entry.key, "MemTotal");
  EXPECT_EQ(entry.value, 16303636U);
}

/** @test Unitless counters (huge page counts) parse the same way. */
TEST(ParseFlatLineTest, KeyValueWithoutUnit) {
  FlatEntry entry;
  ASSERT_TRUE(parseFlatLine("HugePages_Free:       10", entry));
  EXPECT_EQ(entry.key, "HugePages_Free");
  EXPECT_EQ(entry.value, 10U);
}

/** @test Keys with parentheses and underscores are kept verbatim. */
TEST(ParseFlatLineTest, KeepsUnusualKeys) {
  FlatEntry entry;
  ASSERT_TRUE(parseFlatLine("Active(anon):     123 kB", entry));
  EXPECT_EQ(entry.key, "Active(anon)");
  ASSERT_TRUE(parseFlatLine("Committed_AS:\t500000 kB", entry));
  EXPECT_EQ(entry.key, "Committed_AS");
  EXPECT_EQ(entry.value, 500000U);
}

/** @test Lines outside the shape are rejected. */
TEST(ParseFlatLineTest, RejectsMalformed) {
  FlatEntry entry;
  EXPECT_FALSE(parseFlatLine("", entry));
  EXPECT_FALSE(parseFlatLine("no colon here 42", entry));
  EXPECT_FALSE(parseFlatLine(": 42 kB", entry));
  EXPECT_FALSE(parseFlatLine("MemTotal:42", entry));
  EXPECT_FALSE(parseFlatLine("MemTotal:   kB", entry));
  EXPECT_FALSE(parseFlatLine("MemTotal:   -5 kB", entry));
  EXPECT_FALSE(parseFlatLine("Node 0 MemFree:   42 kB", entry));
}

/** @test Control bytes are stripped before matching. */
TEST(ParseFlatLineTest, StripsControlCharacters) {
  FlatEntry entry;
  ASSERT_TRUE(parseFlatLine("Mem\rTotal:   42 kB\a", entry));
  EXPECT_EQ(entry.key, "MemTotal");
  EXPECT_EQ(entry.value, 42U);

  ASSERT_TRUE(parseFlatLine("\x1b"
                            "Cached:\f  7 kB",
                            entry));
  EXPECT_EQ(entry.key, "Cached");
  EXPECT_EQ(entry.value, 7U);

  ASSERT_TRUE(parseFlatLine("Mem\0Free:   9 kB"sv, entry));
  EXPECT_EQ(entry.key, "MemFree");
  EXPECT_EQ(entry.value, 9U);
}

/* ----------------------------- Node Line Tests ----------------------------- */

/** @test Node-scoped line yields node id, key and value. */
TEST(ParseNodeLineTest, NodeKeyValue) {
  NodeEntry entry;
  ASSERT_TRUE(parseNodeLine("Node 1 FilePages:      140000 kB", entry));
  EXPECT_EQ(entry.nodeId, 1);
  EXPECT_EQ(entry.key, "FilePages");
  EXPECT_EQ(entry.value, 140000U);
}

/** @test Multi-digit node ids parse. */
TEST(ParseNodeLineTest, MultiDigitNodeId) {
  NodeEntry entry;
  ASSERT_TRUE(parseNodeLine("Node 12 HugePages_Free:      3", entry));
  EXPECT_EQ(entry.nodeId, 12);
  EXPECT_EQ(entry.value, 3U);
}

/** @test Flat and malformed node lines are rejected. */
TEST(ParseNodeLineTest, RejectsMalformed) {
  NodeEntry entry;
  EXPECT_FALSE(parseNodeLine("MemFree:   42 kB", entry));
  EXPECT_FALSE(parseNodeLine("Node x MemFree:   42 kB", entry));
  EXPECT_FALSE(parseNodeLine("Nodes 0 MemFree:   42 kB", entry));
  EXPECT_FALSE(parseNodeLine("Node 0MemFree:   42 kB", entry));
  EXPECT_FALSE(parseNodeLine("Node 0 MemFree:42", entry));
  EXPECT_FALSE(parseNodeLine("Node 0", entry));
}

/** @test Control bytes are stripped before matching node lines. */
TEST(ParseNodeLineTest, StripsControlCharacters) {
  NodeEntry entry;
  ASSERT_TRUE(parseNodeLine("Node 0 Mem\aFree:   11 kB\r", entry));
  EXPECT_EQ(entry.nodeId, 0);
  EXPECT_EQ(entry.key, "MemFree");
  EXPECT_EQ(entry.value, 11U);
}

/* ----------------------------- File Reader Tests ----------------------------- */

class MetricSourceFileTest : public ::testing::Test {
protected:
  TempDir dir_{};

  void SetUp() override {
    if (!dir_.valid()) {
      GTEST_SKIP() << "/tmp is not writable";
    }
  }
};

/** @test Flat reader captures every matching line. */
TEST_F(MetricSourceFileTest, ReadsFlatFixture) {
  const std::string PATH = dir_.write("meminfo", GLOBAL_MEMINFO);

  RawMetrics metrics;
  ASSERT_EQ(readFlatMetrics(PATH.c_str(), metrics), SourceStatus::OK);
  EXPECT_EQ(metrics.at("MemTotal"), 1000000U);
  EXPECT_EQ(metrics.at("Committed_AS"), 500000U);
  EXPECT_EQ(metrics.at("Hugepagesize"), 2048U);
  EXPECT_EQ(metrics.at("HugePages_Free"), 10U);
}

/** @test An unparseable line changes nothing. */
TEST_F(MetricSourceFileTest, MalformedLineIgnored) {
  std::string noisy(GLOBAL_MEMINFO);
  noisy.insert(noisy.find("Cached:"), "this line is not a metric\n");
  noisy.insert(noisy.find("Slab:"), "Broken: kB\n");

  const std::string CLEAN_PATH = dir_.write("clean", GLOBAL_MEMINFO);
  const std::string NOISY_PATH = dir_.write("noisy", noisy);

  RawMetrics clean;
  RawMetrics dirty;
  ASSERT_EQ(readFlatMetrics(CLEAN_PATH.c_str(), clean), SourceStatus::OK);
  ASSERT_EQ(readFlatMetrics(NOISY_PATH.c_str(), dirty), SourceStatus::OK);
  EXPECT_EQ(clean, dirty);
}

/** @test Later duplicates overwrite earlier values. */
TEST_F(MetricSourceFileTest, DuplicateKeyLastWins) {
  const std::string PATH = dir_.write("dup", "Dirty:   1 kB\nDirty:   2 kB\n");

  RawMetrics metrics;
  ASSERT_EQ(readFlatMetrics(PATH.c_str(), metrics), SourceStatus::OK);
  EXPECT_EQ(metrics.at("Dirty"), 2U);
}

/** @test Reader clears previous contents. */
TEST_F(MetricSourceFileTest, ReaderClearsOutput) {
  const std::string PATH = dir_.write("small", "MemFree:   5 kB\n");

  RawMetrics metrics{{"Stale", 1}};
  ASSERT_EQ(readFlatMetrics(PATH.c_str(), metrics), SourceStatus::OK);
  EXPECT_EQ(metrics.size(), 1U);
  EXPECT_EQ(metrics.count("Stale"), 0U);
}

/** @test Node reader nests by node id. */
TEST_F(MetricSourceFileTest, ReadsNodeFixture) {
  const std::string PATH = dir_.write("node1/meminfo", NODE1_MEMINFO);

  NodeRawMetrics nodes;
  ASSERT_EQ(readNodeMetrics(PATH.c_str(), nodes), SourceStatus::OK);
  ASSERT_EQ(nodes.size(), 1U);
  ASSERT_EQ(nodes.count(1), 1U);
  EXPECT_EQ(nodes.at(1).at("FilePages"), 140000U);
  EXPECT_EQ(nodes.at(1).at("HugePages_Free"), 4U);
}

/** @test Flat lines in a node interface are skipped. */
TEST_F(MetricSourceFileTest, NodeReaderSkipsFlatLines) {
  const std::string PATH = dir_.write("mixed", "MemFree:   5 kB\nNode 0 MemFree:   6 kB\n");

  NodeRawMetrics nodes;
  ASSERT_EQ(readNodeMetrics(PATH.c_str(), nodes), SourceStatus::OK);
  ASSERT_EQ(nodes.size(), 1U);
  EXPECT_EQ(nodes.at(0).at("MemFree"), 6U);
}

/** @test Missing files report INTERFACE_UNAVAILABLE. */
TEST_F(MetricSourceFileTest, MissingFileUnavailable) {
  const std::string PATH = dir_.path() + "/does-not-exist";

  RawMetrics flat;
  NodeRawMetrics nodes;
  EXPECT_EQ(readFlatMetrics(PATH.c_str(), flat), SourceStatus::INTERFACE_UNAVAILABLE);
  EXPECT_EQ(readNodeMetrics(PATH.c_str(), nodes), SourceStatus::INTERFACE_UNAVAILABLE);
}

/* ----------------------------- Live Interface ----------------------------- */

/** @test /proc/meminfo parses with total >= free. */
TEST(MetricSourceLiveTest, ProcMeminfoRelations) {
  RawMetrics metrics;
  if (readFlatMetrics("/proc/meminfo", metrics) != SourceStatus::OK) {
    GTEST_SKIP() << "/proc/meminfo not available";
  }
  ASSERT_EQ(metrics.count("MemTotal"), 1U);
  ASSERT_EQ(metrics.count("MemFree"), 1U);
  EXPECT_GT(metrics.at("MemTotal"), 0U);
  EXPECT_LE(metrics.at("MemFree"), metrics.at("MemTotal"));
}

/* ----------------------------- Status Strings ----------------------------- */

/** @test Every status has a distinct name. */
TEST(SourceStatusTest, ToStringNames) {
  EXPECT_STREQ(toString(SourceStatus::OK), "OK");
  EXPECT_STREQ(toString(SourceStatus::INTERFACE_UNAVAILABLE), "INTERFACE_UNAVAILABLE");
  EXPECT_STREQ(toString(SourceStatus::MISSING_FIELD), "MISSING_FIELD");
}
