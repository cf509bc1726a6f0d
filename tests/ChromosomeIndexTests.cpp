#include <gtest/gtest.h>

// Standard
#include <set>
#include <string>
#include <vector>

// Internal
#include "ChromosomeIndex.hpp"
#include "Errors.hpp"
#include "Peak.hpp"

using namespace intervals;
using dataTypes::Peak;

class ChromosomeIndexTest : public testing::Test {
   protected:
    const std::vector<Peak> peaks = {{"chr1", 100, 200, "peak1", 1.0},
                                     {"chr1", 300, 400, "peak2", 2.0},
                                     {"chr2", 100, 200, "peak3", 3.0},
                                     {"chrX", 50, 50, "peak4", 4.0}};
};

TEST_F(ChromosomeIndexTest, OneTreePerChromosome) {
    const auto index = ChromosomeIndex<Peak>::build(peaks);

    EXPECT_EQ(index.chromosomes(), (std::set<std::string>{"chr1", "chr2", "chrX"}));
    EXPECT_EQ(index.recordCount(), 4ul);
    EXPECT_EQ(index.treeFor("chr1").size(), 2ul);
    EXPECT_EQ(index.treeFor("chr2").size(), 1ul);
}

TEST_F(ChromosomeIndexTest, AbsentChromosomeYieldsEmptyTree) {
    const auto index = ChromosomeIndex<Peak>::build(peaks);

    EXPECT_FALSE(index.contains("chr3"));
    EXPECT_TRUE(index.treeFor("chr3").empty());
    EXPECT_TRUE(index.treeFor("chr3").search(0, 1000).empty());
}

TEST_F(ChromosomeIndexTest, ChromosomesAreIsolated) {
    const auto index = ChromosomeIndex<Peak>::build(peaks);

    const auto chr2Hits = index.treeFor("chr2").search(100, 200);
    ASSERT_EQ(chr2Hits.size(), 1ul);
    EXPECT_EQ(chr2Hits[0]->data.peakName, "peak3");
}

TEST_F(ChromosomeIndexTest, EmptyInputBuildsEmptyIndex) {
    const auto index = ChromosomeIndex<Peak>::build(std::vector<Peak>{});

    EXPECT_TRUE(index.empty());
    EXPECT_TRUE(index.chromosomes().empty());
    EXPECT_EQ(index.recordCount(), 0ul);
}

TEST_F(ChromosomeIndexTest, ReversedRecordRejectsBatch) {
    auto malformed = peaks;
    malformed.push_back({"chr1", 500, 499, "reversed", 0.0});

    EXPECT_THROW(static_cast<void>(ChromosomeIndex<Peak>::build(malformed)),
                 errors::MalformedRecordError);
}

TEST_F(ChromosomeIndexTest, MissingChromosomeRejectsBatch) {
    auto malformed = peaks;
    malformed.insert(malformed.begin(), Peak{"", 1, 2, "unnamed", 0.0});

    EXPECT_THROW(static_cast<void>(ChromosomeIndex<Peak>::build(malformed)),
                 errors::MalformedRecordError);
}
