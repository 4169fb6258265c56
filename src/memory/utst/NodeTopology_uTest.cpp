/**
 * @file NodeTopology_uTest.cpp
 * @brief Unit tests for memsampler::memory node count discovery.
 *
 * Notes:
 *  - Node count equals the number of distinct physical ids in cpuinfo.
 *  - Live test only checks that discovery succeeds.
 */

#include "src/memory/inc/NodeTopology.hpp"
#include "src/memory/utst/MemoryFixtures.hpp"

#include <gtest/gtest.h>

#include <string>

using memsampler::memory::countPhysicalIds;
using memsampler::memory::CPUINFO_PATH;
using memsampler::memory::discoverNodeTopology;
using memsampler::memory::NodeTopology;
using memsampler::memory::parsePhysicalIdLine;
using memsampler::memory::SourceStatus;
using memsampler::memory::fixtures::TempDir;

namespace {

constexpr const char* TWO_SOCKET_CPUINFO = "processor\t: 0\n"
                                           "vendor_id\t: GenuineIntel\n"
                                           "physical id\t: 0\n"
                                           "core id\t\t: 0\n"
                                           "\n"
                                           "processor\t: 1\n"
                                           "physical id\t: 0\n"
                                           "core id\t\t: 1\n"
                                           "\n"
                                           "processor\t: 2\n"
                                           "physical id\t: 1\n"
                                           "core id\t\t: 0\n"
                                           "\n"
                                           "processor\t: 3\n"
                                           "physical id\t: 1\n"
                                           "core id\t\t: 1\n";

} // namespace

/* ----------------------------- parsePhysicalIdLine ----------------------------- */

/** @test Tab-padded field parses. */
TEST(ParsePhysicalIdLineTest, TabPadded) {
  int id = -1;
  ASSERT_TRUE(parsePhysicalIdLine("physical id\t: 3", id));
  EXPECT_EQ(id, 3);
}

/** @test Other cpuinfo fields are rejected. */
TEST(ParsePhysicalIdLineTest, RejectsOtherFields) {
  int id = -1;
  EXPECT_FALSE(parsePhysicalIdLine("core id\t\t: 0", id));
  EXPECT_FALSE(parsePhysicalIdLine("processor\t: 0", id));
  EXPECT_FALSE(parsePhysicalIdLine("physical id\t: ", id));
  EXPECT_FALSE(parsePhysicalIdLine("physical id 0", id));
}

/* ----------------------------- countPhysicalIds ----------------------------- */

/** @test Repeated ids count once. */
TEST(CountPhysicalIdsTest, DistinctIds) { EXPECT_EQ(countPhysicalIds(TWO_SOCKET_CPUINFO), 2U); }

/** @test Field absent (some ARM and VM hosts) gives zero nodes. */
TEST(CountPhysicalIdsTest, AbsentFieldIsZero) {
  EXPECT_EQ(countPhysicalIds("processor\t: 0\nBogoMIPS\t: 50.00\n"), 0U);
  EXPECT_EQ(countPhysicalIds(""), 0U);
}

/** @test Last line without trailing newline still counts. */
TEST(CountPhysicalIdsTest, NoTrailingNewline) {
  EXPECT_EQ(countPhysicalIds("physical id\t: 0\nphysical id\t: 4"), 2U);
}

/* ----------------------------- discoverNodeTopology ----------------------------- */

class NodeTopologyFileTest : public ::testing::Test {
protected:
  TempDir dir_{};

  void SetUp() override {
    if (!dir_.valid()) {
      GTEST_SKIP() << "/tmp is not writable";
    }
  }
};

/** @test Fixture with two sockets yields a NUMA topology. */
TEST_F(NodeTopologyFileTest, TwoSocketFixture) {
  const std::string PATH = dir_.write("cpuinfo", TWO_SOCKET_CPUINFO);

  NodeTopology topo;
  ASSERT_EQ(discoverNodeTopology(PATH.c_str(), topo), SourceStatus::OK);
  EXPECT_EQ(topo.nodeCount, 2U);
  EXPECT_TRUE(topo.isNuma());
  EXPECT_NE(topo.toString().find("NUMA"), std::string::npos);
}

/** @test Fixture without the field yields zero nodes. */
TEST_F(NodeTopologyFileTest, NoPhysicalIdFixture) {
  const std::string PATH = dir_.write("cpuinfo", "processor\t: 0\nprocessor\t: 1\n");

  NodeTopology topo;
  ASSERT_EQ(discoverNodeTopology(PATH.c_str(), topo), SourceStatus::OK);
  EXPECT_EQ(topo.nodeCount, 0U);
  EXPECT_FALSE(topo.isNuma());
}

/** @test File discovery and text counting agree on padded, unordered, non-contiguous ids. */
TEST_F(NodeTopologyFileTest, MatchesTextCount) {
  constexpr const char* CPUINFO = "physical id\t: 3\n"
                                  "physical id : 0\n"
                                  "physical id\t: 3\n"
                                  "physical id\t:\n"
                                  "physical ids\t: 9\n"
                                  "physical id\t: 7";
  const std::string PATH = dir_.write("cpuinfo", CPUINFO);

  NodeTopology topo;
  ASSERT_EQ(discoverNodeTopology(PATH.c_str(), topo), SourceStatus::OK);
  EXPECT_EQ(topo.nodeCount, 3U);
  EXPECT_EQ(topo.nodeCount, countPhysicalIds(CPUINFO));
}

/** @test Missing cpuinfo is an interface failure. */
TEST_F(NodeTopologyFileTest, MissingFileUnavailable) {
  const std::string PATH = dir_.path() + "/missing";

  NodeTopology topo;
  topo.nodeCount = 7;
  EXPECT_EQ(discoverNodeTopology(PATH.c_str(), topo), SourceStatus::INTERFACE_UNAVAILABLE);
  EXPECT_EQ(topo.nodeCount, 0U);
}

/** @test Live cpuinfo is readable on Linux hosts. */
TEST(NodeTopologyLiveTest, ReadsProcCpuinfo) {
  NodeTopology topo;
  if (discoverNodeTopology(CPUINFO_PATH, topo) != SourceStatus::OK) {
    GTEST_SKIP() << CPUINFO_PATH << " not available";
  }
  EXPECT_FALSE(topo.toString().empty());
}
