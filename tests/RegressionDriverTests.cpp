#include <gtest/gtest.h>

// Standard
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// Boost
#include <boost/program_options/variables_map.hpp>

// Internal
#include "ExpressionRecord.hpp"
#include "MotifGeneRecord.hpp"
#include "MotifGeneTable.hpp"
#include "RegressData.hpp"
#include "RegressParameters.hpp"
#include "RegressionDriver.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

using namespace pipelines::regression;
using dataTypes::ExpressionRecord;
using dataTypes::ExpressionRecords;
using dataTypes::MotifGeneRecord;
using dataTypes::MotifGeneRecords;

namespace {

auto makeRegressParameters(size_t minimumSampleCount) -> RegressParameters {
    po::variables_map params;
    params.insert({"outdir", po::variable_value(fs::temp_directory_path().string(), false)});
    params.insert({"loglevel", po::variable_value(std::string("warning"), false)});
    params.insert({"threads", po::variable_value(1, false)});
    params.insert({"expression", po::variable_value(
                                     std::string(TEST_DATA_DIR) + "/expression.tsv", false)});
    params.insert({"minsamples", po::variable_value(minimumSampleCount, false)});
    return RegressParameters{params, false};
}

auto makeRecord(const std::string& geneSymbol, const std::string& motifID,
                const std::string& motifName, double motifScore) -> MotifGeneRecord {
    MotifGeneRecord record{};
    record.chrom = "chr1";
    record.motifID = motifID;
    record.motifName = motifName;
    record.motifScore = motifScore;
    record.geneName = geneSymbol + "_name";
    record.geneSymbol = geneSymbol;
    return record;
}

// Adds one row per gene for a factor; gene i gets motif score scores[i] and expression
// expressionValues[i].
void addFactor(const std::string& factor, const std::vector<double>& scores,
               const std::vector<double>& expressionValues, MotifGeneRecords& records,
               ExpressionRecords& expression) {
    for (size_t i = 0; i < scores.size(); ++i) {
        const std::string geneSymbol = factor + "_gene" + std::to_string(i);
        records.push_back(makeRecord(geneSymbol, factor + "_motif", factor, scores[i]));
        expression.push_back(ExpressionRecord{geneSymbol, expressionValues[i]});
    }
}

}  // namespace

class RegressionDriverTest : public testing::Test {
   protected:
    RegressionDriverTest() : driver(makeRegressParameters(5)) {}

    RegressionDriver driver;
};

TEST_F(RegressionDriverTest, FactorsBelowMinimumSampleCountAreSkipped) {
    MotifGeneRecords records;
    ExpressionRecords expression;
    addFactor("FOUR", {1.0, 2.0, 3.0, 4.0}, {1.0, 3.0, 2.0, 5.0}, records, expression);
    addFactor("FIVE", {1.0, 2.0, 3.0, 4.0, 5.0}, {3.1, 4.9, 7.2, 8.8, 11.0}, records, expression);

    const auto results = driver.regress(records, expression);

    ASSERT_EQ(results.size(), 1ul);
    EXPECT_EQ(results[0].transcriptionFactor, "FIVE");
    EXPECT_NEAR(results[0].slope, 1.97, 1e-12);
    EXPECT_NEAR(results[0].pValue, 4.8054228974e-05, 1e-12);
    EXPECT_EQ(results[0].sampleCount, 5ul);
}

TEST_F(RegressionDriverTest, DuplicateSymbolMotifPairsAreCountedOnce) {
    MotifGeneRecords records;
    ExpressionRecords expression;
    addFactor("ALIASED", {1.0, 2.0, 3.0, 4.0}, {1.0, 3.0, 2.0, 5.0}, records, expression);

    // Same gene symbol and motif under another gene name
    auto alias = records.front();
    alias.geneName = "alias_of_gene0";
    alias.motifScore = 9.0;
    records.push_back(alias);

    EXPECT_TRUE(driver.regress(records, expression).empty());
}

TEST_F(RegressionDriverTest, FirstOfDuplicateRowsIsKept) {
    MotifGeneRecords records;
    ExpressionRecords expression;
    addFactor("KEEP", {1.0, 2.0, 3.0, 4.0, 5.0}, {3.1, 4.9, 7.2, 8.8, 11.0}, records, expression);

    auto duplicate = records.front();
    duplicate.motifScore = 100.0;
    records.push_back(duplicate);

    const auto results = driver.regress(records, expression);

    ASSERT_EQ(results.size(), 1ul);
    EXPECT_NEAR(results[0].slope, 1.97, 1e-12);
}

TEST_F(RegressionDriverTest, GenesWithoutExpressionAreDropped) {
    MotifGeneRecords records;
    ExpressionRecords expression;
    addFactor("PARTIAL", {1.0, 2.0, 3.0, 4.0, 5.0}, {3.1, 4.9, 7.2, 8.8, 11.0}, records,
              expression);
    expression.pop_back();

    EXPECT_TRUE(driver.regress(records, expression).empty());
}

TEST_F(RegressionDriverTest, ConstantMotifScoreIsSkipped) {
    MotifGeneRecords records;
    ExpressionRecords expression;
    addFactor("CONSTANT", {2.0, 2.0, 2.0, 2.0, 2.0}, {1.0, 2.0, 3.0, 4.0, 5.0}, records,
              expression);
    addFactor("VARYING", {1.0, 2.0, 3.0, 4.0, 5.0}, {3.1, 4.9, 7.2, 8.8, 11.0}, records,
              expression);

    const auto results = driver.regress(records, expression);

    ASSERT_EQ(results.size(), 1ul);
    EXPECT_EQ(results[0].transcriptionFactor, "VARYING");
}

TEST_F(RegressionDriverTest, ResultsAreSortedByPValue) {
    MotifGeneRecords records;
    ExpressionRecords expression;
    addFactor("A_WEAK", {1.0, 2.0, 3.0, 4.0, 5.0, 6.0}, {2.0, 1.0, 4.0, 3.0, 6.0, 5.0}, records,
              expression);
    addFactor("Z_STRONG", {1.0, 2.0, 3.0, 4.0, 5.0}, {3.1, 4.9, 7.2, 8.8, 11.0}, records,
              expression);

    const auto results = driver.regress(records, expression);

    ASSERT_EQ(results.size(), 2ul);
    EXPECT_EQ(results[0].transcriptionFactor, "Z_STRONG");
    EXPECT_EQ(results[1].transcriptionFactor, "A_WEAK");
    EXPECT_LE(results[0].pValue, results[1].pValue);
}

TEST_F(RegressionDriverTest, EmptyInputYieldsNoResults) {
    EXPECT_TRUE(driver.regress({}, {}).empty());
}

TEST(RegressionDriverMinimumTest, MinimumSampleCountIsConfigurable) {
    const RegressionDriver driver(makeRegressParameters(4));

    MotifGeneRecords records;
    ExpressionRecords expression;
    addFactor("FOUR", {1.0, 2.0, 3.0, 4.0}, {1.0, 3.0, 2.0, 5.0}, records, expression);

    EXPECT_EQ(driver.regress(records, expression).size(), 1ul);
}

TEST(RegressionDriverWriteTest, WritesHeaderAndRows) {
    const fs::path outPath = fs::temp_directory_path() / "garnet_regression_results_test.tsv";

    RegressionDriver::writeResults({{"TF1", 1.5, 0.25, 5}, {"TF2", -2.0, 0.5, 6}}, outPath);

    std::ifstream resultsIn(outPath);
    std::vector<std::string> lines;
    for (std::string line; std::getline(resultsIn, line);) {
        lines.push_back(line);
    }
    fs::remove(outPath);

    ASSERT_EQ(lines.size(), 3ul);
    EXPECT_EQ(lines[0], "Transcription Factor\tSlope\tP-Value");
    EXPECT_EQ(lines[1], "TF1\t1.5\t0.25");
    EXPECT_EQ(lines[2], "TF2\t-2\t0.5");
}

TEST(RegressDataTest, SampleNamesDropMappingSuffix) {
    const fs::path tablePath = fs::temp_directory_path() / "sampleA_motifs_and_genes.tsv";
    pipelines::mapping::MotifGeneTable::write({makeRecord("G1", "M1", "TF1", 1.0)}, tablePath,
                                              false);

    const auto data = RegressData::fromMappingFiles(fs::temp_directory_path(), {tablePath});
    fs::remove(tablePath);

    ASSERT_EQ(data.samples.size(), 1ul);
    EXPECT_EQ(data.samples[0].sampleName, "sampleA");
    EXPECT_EQ(data.samples[0].regressionResultsPath,
              fs::temp_directory_path() / "sampleA_regression_results.tsv");
    ASSERT_EQ(data.samples[0].motifsAndGenes.size(), 1ul);
    EXPECT_EQ(data.samples[0].motifsAndGenes[0].geneSymbol, "G1");
}
