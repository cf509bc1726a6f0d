#pragma once

// Standard
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

// Internal
#include "ExpressionRecord.hpp"
#include "MotifGeneRecord.hpp"
#include "RegressData.hpp"
#include "RegressParameters.hpp"

namespace pipelines::regression {

namespace fs = std::filesystem;

struct RegressionResult {
    std::string transcriptionFactor;
    double slope;
    double pValue;
    size_t sampleCount;
};

/**
 * @brief Relates motif strength to the expression of the genes sharing a peak with the motif.
 *
 * Motif and gene rows are joined with the expression table on the gene symbol. Rows repeating
 * a (geneSymbol, motifID) pair are dropped, keeping the first. The remaining rows are grouped
 * by motif name and every group with at least minimumSampleCount rows is fitted with
 * expression ~ motifScore.
 */
class RegressionDriver {
   public:
    explicit RegressionDriver(RegressParameters params) : parameters(std::move(params)) {};

    void process(const RegressData &data) const;

    // Results are sorted by ascending p-value.
    [[nodiscard]] auto regress(const dataTypes::MotifGeneRecords &motifsAndGenes,
                               const dataTypes::ExpressionRecords &expression) const
        -> std::vector<RegressionResult>;

    static void writeResults(const std::vector<RegressionResult> &results,
                             const fs::path &outPath);

   private:
    RegressParameters parameters;

    struct Observation {
        double motifScore;
        double expression;
    };

    [[nodiscard]] static auto joinExpression(const dataTypes::MotifGeneRecords &motifsAndGenes,
                                             const dataTypes::ExpressionRecords &expression)
        -> std::vector<std::pair<const dataTypes::MotifGeneRecord *, double>>;
};

}  // namespace pipelines::regression
