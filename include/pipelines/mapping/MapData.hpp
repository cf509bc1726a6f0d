#pragma once

// Standard
#include <filesystem>
#include <vector>

// Internal
#include "MapSample.hpp"
#include "PipelineData.hpp"

namespace pipelines {
namespace mapping {
struct MapData : PipelineData {
    std::vector<MapSample> samples;

    MapData(const fs::path &outputDir, const std::vector<fs::path> &peakFilePaths);
};

}  // namespace mapping
}  // namespace pipelines
