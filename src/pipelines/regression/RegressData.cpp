#include "RegressData.hpp"

#include <utility>

#include "Constants.hpp"
#include "MotifGeneTable.hpp"
#include "Utility.hpp"

namespace pipelines::regression {

auto RegressData::fromMappingFiles(const fs::path &outputDir,
                                   const std::vector<fs::path> &mappingPaths) -> RegressData {
    RegressData data;
    data.samples.reserve(mappingPaths.size());

    for (const auto &mappingPath : mappingPaths) {
        std::string sampleName = getSampleName(mappingPath);
        const std::string &suffix = constants::regression::mappingSampleSuffix;
        if (helper::hasSuffix(sampleName, suffix) && sampleName.size() > suffix.size()) {
            sampleName.erase(sampleName.size() - suffix.size());
        }

        data.samples.push_back(
            RegressSample{.sampleName = sampleName,
                          .motifsAndGenes = mapping::MotifGeneTable::read(mappingPath),
                          .regressionResultsPath = regressionResultsPath(outputDir, sampleName)});
    }

    return data;
}

auto RegressData::fromMappingResults(const fs::path &outputDir,
                                     std::vector<mapping::MappingResult> results) -> RegressData {
    RegressData data;
    data.samples.reserve(results.size());

    for (auto &result : results) {
        data.samples.push_back(RegressSample{
            .sampleName = result.sampleName,
            .motifsAndGenes = std::move(result.records),
            .regressionResultsPath = regressionResultsPath(outputDir, result.sampleName)});
    }

    return data;
}

auto RegressData::regressionResultsPath(const fs::path &outputDir, const std::string &sampleName)
    -> fs::path {
    return outputDir / (sampleName + constants::regression::regressionFileSuffix);
}

}  // namespace pipelines::regression
