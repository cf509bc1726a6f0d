#pragma once

// Standard
#include <filesystem>
#include <string>
#include <vector>

// Internal
#include "PeakMapper.hpp"
#include "PipelineData.hpp"
#include "RegressSample.hpp"

namespace pipelines {
namespace regression {
struct RegressData : PipelineData {
    std::vector<RegressSample> samples;

    // Reads every motif and gene table written by the map subcall.
    static auto fromMappingFiles(const fs::path &outputDir,
                                 const std::vector<fs::path> &mappingPaths) -> RegressData;

    static auto fromMappingResults(const fs::path &outputDir,
                                   std::vector<mapping::MappingResult> results) -> RegressData;

   private:
    static auto regressionResultsPath(const fs::path &outputDir, const std::string &sampleName)
        -> fs::path;
};

}  // namespace regression
}  // namespace pipelines
