#include <gtest/gtest.h>

// Standard
#include <set>
#include <string>
#include <vector>

// Internal
#include "ChromosomeIndex.hpp"
#include "GenomicFeature.hpp"
#include "IntersectionEngine.hpp"
#include "Peak.hpp"

using namespace intervals;
using dataTypes::GeneFeature;
using dataTypes::Peak;
using dataTypes::Strand;

class IntersectionEngineTest : public testing::Test {
   protected:
    const std::vector<Peak> peaks = {{"chr1", 140, 170, "peak1", 1.0},
                                     {"chr1", 500, 600, "peak2", 1.0},
                                     {"chr2", 100, 200, "peak3", 1.0},
                                     {"chr3", 100, 200, "peak4", 1.0}};

    const std::vector<GeneFeature> genes = {{"chr1", 100, 200, Strand::FORWARD, "gene1", "G1"},
                                            {"chr1", 170, 300, Strand::REVERSE, "gene2", "G2"},
                                            {"chr1", 601, 700, Strand::FORWARD, "gene3", "G3"},
                                            {"chr2", 150, 160, Strand::FORWARD, "gene4", "G4"},
                                            {"chr4", 100, 200, Strand::FORWARD, "gene5", "G5"}};
};

TEST_F(IntersectionEngineTest, CommonChromosomes) {
    EXPECT_EQ(IntersectionEngine::commonChromosomes({"chr1", "chr2", "chr3"}, {"chr2", "chr4"}),
              std::vector<std::string>{"chr2"});
    EXPECT_TRUE(IntersectionEngine::commonChromosomes({"chr1"}, {"chr2"}).empty());
}

TEST_F(IntersectionEngineTest, IntersectReportsOnlyMatchedQueries) {
    const auto peakIndex = ChromosomeIndex<Peak>::build(peaks);
    const auto geneIndex = ChromosomeIndex<GeneFeature>::build(genes);

    const auto overlaps = IntersectionEngine::intersect(peakIndex, geneIndex);

    ASSERT_EQ(overlaps.size(), 2ul);

    EXPECT_EQ(overlaps[0].referenceID, "chr1");
    EXPECT_EQ(overlaps[0].query->peakName, "peak1");
    std::set<std::string> peak1Genes;
    for (const auto* gene : overlaps[0].matches) {
        peak1Genes.insert(gene->geneSymbol);
    }
    EXPECT_EQ(peak1Genes, (std::set<std::string>{"G1", "G2"}));

    EXPECT_EQ(overlaps[1].referenceID, "chr2");
    EXPECT_EQ(overlaps[1].query->peakName, "peak3");
    ASSERT_EQ(overlaps[1].matches.size(), 1ul);
    EXPECT_EQ(overlaps[1].matches[0]->geneSymbol, "G4");
}

TEST_F(IntersectionEngineTest, IntersectPairsFlattensMatches) {
    const auto peakIndex = ChromosomeIndex<Peak>::build(peaks);
    const auto geneIndex = ChromosomeIndex<GeneFeature>::build(genes);

    const auto pairs = IntersectionEngine::intersectPairs(peakIndex, geneIndex);

    ASSERT_EQ(pairs.size(), 3ul);
    for (const auto& [peak, gene] : pairs) {
        EXPECT_EQ(peak->referenceID, gene->referenceID);
        EXPECT_LE(peak->startPosition, gene->endPosition);
        EXPECT_LE(gene->startPosition, peak->endPosition);
    }
}

TEST_F(IntersectionEngineTest, DisjointChromosomesYieldNothing) {
    const auto peakIndex =
        ChromosomeIndex<Peak>::build(std::vector<Peak>{{"chr7", 1, 1000, "peak", 1.0}});
    const auto geneIndex = ChromosomeIndex<GeneFeature>::build(genes);

    EXPECT_TRUE(IntersectionEngine::intersect(peakIndex, geneIndex).empty());
}

TEST_F(IntersectionEngineTest, EmptyIndicesYieldNothing) {
    const ChromosomeIndex<Peak> emptyPeaks{};
    const ChromosomeIndex<GeneFeature> emptyGenes{};
    const auto geneIndex = ChromosomeIndex<GeneFeature>::build(genes);
    const auto peakIndex = ChromosomeIndex<Peak>::build(peaks);

    EXPECT_TRUE(IntersectionEngine::intersect(emptyPeaks, geneIndex).empty());
    EXPECT_TRUE(IntersectionEngine::intersect(peakIndex, emptyGenes).empty());
    EXPECT_TRUE(IntersectionEngine::intersect(emptyPeaks, emptyGenes).empty());
}
