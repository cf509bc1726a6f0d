#include "RegressionDriver.hpp"

// Standard
#include <algorithm>
#include <fstream>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_map>

// Internal
#include "Errors.hpp"
#include "ExpressionParser.hpp"
#include "LinearRegression.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

using namespace dataTypes;

namespace pipelines::regression {

void RegressionDriver::process(const RegressData &data) const {
    const auto expression = ExpressionParser::parse(parameters.expressionPath);

    for (const auto &sample : data.samples) {
        Logger::log(LogLevel::INFO, "Processing sample: ", sample.sampleName);

        const auto results = regress(sample.motifsAndGenes, expression);
        writeResults(results, sample.regressionResultsPath);
    }
}

auto RegressionDriver::joinExpression(const MotifGeneRecords &motifsAndGenes,
                                      const ExpressionRecords &expression)
    -> std::vector<std::pair<const MotifGeneRecord *, double>> {
    std::unordered_map<std::string, std::vector<double>> expressionBySymbol;
    for (const auto &record : expression) {
        expressionBySymbol[record.geneSymbol].push_back(record.expression);
    }

    std::vector<std::pair<const MotifGeneRecord *, double>> joined;
    for (const auto &record : motifsAndGenes) {
        const auto match = expressionBySymbol.find(record.geneSymbol);
        if (match == expressionBySymbol.end()) {
            continue;
        }
        for (const double value : match->second) {
            joined.emplace_back(&record, value);
        }
    }
    return joined;
}

auto RegressionDriver::regress(const MotifGeneRecords &motifsAndGenes,
                               const ExpressionRecords &expression) const
    -> std::vector<RegressionResult> {
    const auto joined = joinExpression(motifsAndGenes, expression);

    std::set<std::pair<std::string, std::string>> seenSymbolMotifPairs;
    std::map<std::string, std::vector<Observation>> observationsByFactor;

    for (const auto &[record, value] : joined) {
        if (!seenSymbolMotifPairs.emplace(record->geneSymbol, record->motifID).second) {
            continue;
        }
        observationsByFactor[record->motifName].push_back(
            Observation{.motifScore = record->motifScore, .expression = value});
    }

    Logger::log(LogLevel::INFO, "Performing linear regression on ", observationsByFactor.size(),
                " transcription factor expression profiles");

    std::vector<RegressionResult> results;
    for (const auto &[factor, observations] : observationsByFactor) {
        if (observations.size() < parameters.minimumSampleCount) {
            Logger::log(LogLevel::DEBUG, "Skipping ", factor, ": ", observations.size(),
                        " genes, at least ", parameters.minimumSampleCount, " required");
            continue;
        }

        std::vector<double> motifScores;
        std::vector<double> expressionValues;
        motifScores.reserve(observations.size());
        expressionValues.reserve(observations.size());
        for (const auto &observation : observations) {
            motifScores.push_back(observation.motifScore);
            expressionValues.push_back(observation.expression);
        }

        try {
            const auto fit = LinearRegression::fit(motifScores, expressionValues);
            results.push_back(RegressionResult{.transcriptionFactor = factor,
                                               .slope = fit.slope,
                                               .pValue = fit.pValue,
                                               .sampleCount = fit.sampleCount});
        } catch (const errors::RegressionFailure &e) {
            Logger::log(LogLevel::WARNING, "Regression failed for ", factor, ": ", e.what());
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const RegressionResult &lhs, const RegressionResult &rhs) {
                         return lhs.pValue < rhs.pValue;
                     });

    Logger::log(LogLevel::INFO, "Fitted ", results.size(), " of ", observationsByFactor.size(),
                " transcription factors");

    return results;
}

void RegressionDriver::writeResults(const std::vector<RegressionResult> &results,
                                    const fs::path &outPath) {
    std::ofstream resultsOut(outPath);
    if (!resultsOut.is_open()) {
        throw std::runtime_error("Could not open file: " + outPath.string());
    }

    resultsOut << "Transcription Factor\tSlope\tP-Value\n";
    for (const auto &result : results) {
        resultsOut << result.transcriptionFactor << '\t' << helper::formatDouble(result.slope)
                   << '\t' << helper::formatDouble(result.pValue) << '\n';
    }

    Logger::log(LogLevel::INFO, "Wrote ", results.size(), " regression results to ",
                outPath.string());
}

}  // namespace pipelines::regression
