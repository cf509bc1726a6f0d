#include <gtest/gtest.h>

// Standard
#include <string>
#include <vector>

// Internal
#include "Errors.hpp"
#include "ExpressionParser.hpp"
#include "FeatureParser.hpp"
#include "MotifGeneTable.hpp"
#include "PeakParser.hpp"

using annotation::FeatureParser;
using annotation::PeakParser;

const std::string testDataDir = TEST_DATA_DIR;

TEST(FeatureParserTest, ParsesGeneTable) {
    const auto genes = FeatureParser::parseGenes(testDataDir + "/genes.tsv");

    ASSERT_EQ(genes.size(), 3ul);
    EXPECT_EQ(genes[0], (dataTypes::GeneFeature{"chr1", 100, 200, dataTypes::Strand::FORWARD,
                                                "NM_0001", "G1"}));
    EXPECT_EQ(genes[1].strand, dataTypes::Strand::REVERSE);
    EXPECT_EQ(genes[2].referenceID, "chr2");
}

TEST(FeatureParserTest, ParsesMotifTable) {
    const auto motifs = FeatureParser::parseMotifs(testDataDir + "/motifs.tsv");

    ASSERT_EQ(motifs.size(), 3ul);
    EXPECT_EQ(motifs[0].motifID, "M1");
    EXPECT_EQ(motifs[0].motifName, "TF_A");
    EXPECT_DOUBLE_EQ(motifs[0].motifScore, 4.5);
    EXPECT_DOUBLE_EQ(motifs[1].motifScore, 2.25);
}

TEST(FeatureParserTest, InvalidStrandRejectsGeneTable) {
    EXPECT_THROW(static_cast<void>(FeatureParser::parseGenes(testDataDir + "/malformed_genes.tsv")),
                 errors::MalformedRecordError);
}

struct MalformedLineParam {
    std::string line;
};

void PrintTo(const MalformedLineParam& param, std::ostream* outputStream) {
    *outputStream << "\"" << param.line << "\"";
}

class MalformedGeneLineTest : public testing::TestWithParam<MalformedLineParam> {};

TEST_P(MalformedGeneLineTest, Throws) {
    EXPECT_THROW(static_cast<void>(FeatureParser::parseGeneLine(GetParam().line, "genes:1")),
                 errors::MalformedRecordError);
}

INSTANTIATE_TEST_SUITE_P(Default, MalformedGeneLineTest,
                         testing::Values(MalformedLineParam{"chr1\t100\t200\tNM\tG1"},
                                         MalformedLineParam{"chr1\t100\t200\tNM\tG1\t+\textra"},
                                         MalformedLineParam{"chr1\tone\t200\tNM\tG1\t+"},
                                         MalformedLineParam{"chr1\t100\t2e2\tNM\tG1\t+"},
                                         MalformedLineParam{"chr1\t100\t200\tNM\tG1\t."}));

class MalformedMotifLineTest : public testing::TestWithParam<MalformedLineParam> {};

TEST_P(MalformedMotifLineTest, Throws) {
    EXPECT_THROW(static_cast<void>(FeatureParser::parseMotifLine(GetParam().line, "motifs:1")),
                 errors::MalformedRecordError);
}

INSTANTIATE_TEST_SUITE_P(Default, MalformedMotifLineTest,
                         testing::Values(MalformedLineParam{"chr1\t150\t160\tM1\tTF_A"},
                                         MalformedLineParam{"chr1\t150\t160\tM1\tTF_A\thigh"},
                                         MalformedLineParam{"chr1\t150.5\t160\tM1\tTF_A\t1"}));

TEST(PeakParserTest, SkipsHeaderCommentAndBlankLines) {
    const auto peaks = PeakParser::parse(testDataDir + "/peaks.bed");

    ASSERT_EQ(peaks.size(), 3ul);
    EXPECT_EQ(peaks[0], (dataTypes::Peak{"chr1", 140, 170, "peak1", 10.5}));
    EXPECT_EQ(peaks[1], (dataTypes::Peak{"chr1", 4800, 5100, "peak2", 3.0}));
    EXPECT_EQ(peaks[2].peakName, "peak3");
}

TEST(PeakParserTest, MalformedRowRejectsFile) {
    EXPECT_THROW(static_cast<void>(PeakParser::parse(testDataDir + "/malformed_peaks.bed")),
                 errors::MalformedRecordError);
}

TEST(PeakParserTest, MissingFileThrows) {
    EXPECT_THROW(static_cast<void>(PeakParser::parse(testDataDir + "/no_such_file.bed")),
                 std::runtime_error);
}

class MalformedPeakLineTest : public testing::TestWithParam<MalformedLineParam> {};

TEST_P(MalformedPeakLineTest, Throws) {
    EXPECT_THROW(static_cast<void>(PeakParser::parseLine(GetParam().line, "peaks:1")),
                 errors::MalformedRecordError);
}

INSTANTIATE_TEST_SUITE_P(
    Default, MalformedPeakLineTest,
    testing::Values(MalformedLineParam{"chr1\t140\t170\tpeak1"},
                    MalformedLineParam{"chr1\t140\t170\tpeak1\t1\t2\t3\t4\t5\t6\t7\t8\t9"},
                    MalformedLineParam{"chr1\tx\t170\tpeak1\t1"},
                    MalformedLineParam{"chr1\t140\t170\tpeak1\tscore"},
                    MalformedLineParam{"chr1 140 170 peak1 1"}));

TEST(ExpressionParserTest, ParsesTwoColumns) {
    const auto expression =
        pipelines::regression::ExpressionParser::parse(testDataDir + "/expression.tsv");

    ASSERT_EQ(expression.size(), 2ul);
    EXPECT_EQ(expression[0], (dataTypes::ExpressionRecord{"GENE_A1", 1.5}));
    EXPECT_EQ(expression[1], (dataTypes::ExpressionRecord{"GENE_A2", 2.5}));
}

TEST(ExpressionParserTest, MalformedLinesThrow) {
    using pipelines::regression::ExpressionParser;
    EXPECT_THROW(static_cast<void>(ExpressionParser::parseLine("GENE\t1.0\textra", "expr:1")),
                 errors::MalformedRecordError);
    EXPECT_THROW(static_cast<void>(ExpressionParser::parseLine("GENE\tNaNish", "expr:1")),
                 errors::MalformedRecordError);
    EXPECT_THROW(static_cast<void>(ExpressionParser::parseLine("\t1.0", "expr:1")),
                 errors::MalformedRecordError);
}

TEST(MotifGeneTableTest, HeaderColumns) {
    using pipelines::mapping::MotifGeneTable;
    EXPECT_EQ(MotifGeneTable::header(false),
              "chrom\tmotifStart\tmotifEnd\tmotifID\tmotifName\tmotifScore\tgeneName\tgeneSymbol\t"
              "geneStart\tgeneEnd\tpeakName");
    EXPECT_EQ(MotifGeneTable::header(true), MotifGeneTable::header(false) + "\tpeakType");
}

TEST(MotifGeneTableTest, ParsesRowWithPeakType) {
    using pipelines::mapping::MotifGeneTable;
    const auto record = MotifGeneTable::parseLine(
        "chr1\t150\t160\tM1\tTF_A\t4.5\tNM_0001\tG1\t100\t200\tpeak1\tpromoter", "table:2");

    EXPECT_EQ(record.chrom, "chr1");
    EXPECT_EQ(record.motifStart, 150);
    EXPECT_EQ(record.motifEnd, 160);
    EXPECT_EQ(record.motifID, "M1");
    EXPECT_DOUBLE_EQ(record.motifScore, 4.5);
    EXPECT_EQ(record.geneSymbol, "G1");
    EXPECT_EQ(record.geneEnd, 200);
    EXPECT_EQ(record.peakName, "peak1");
    EXPECT_EQ(record.peakType, dataTypes::PeakRelationship::PROMOTER);
    EXPECT_FALSE(record.geneStrand.has_value());
}

TEST(MotifGeneTableTest, RejectsUnknownPeakType) {
    using pipelines::mapping::MotifGeneTable;
    EXPECT_THROW(static_cast<void>(MotifGeneTable::parseLine(
                     "chr1\t150\t160\tM1\tTF_A\t4.5\tNM_0001\tG1\t100\t200\tpeak1\tintergenic",
                     "table:2")),
                 errors::MalformedRecordError);
}
