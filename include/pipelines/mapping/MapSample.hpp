#pragma once

// Standard
#include <filesystem>
#include <string>

namespace pipelines {
namespace mapping {
namespace fs = std::filesystem;

struct MapInput {
    std::string sampleName;

    fs::path peakFilePath;
};

struct MapOutput {
    fs::path motifsAndGenesPath;
};

struct MapSample {
    MapInput input;
    MapOutput output;
};

}  // namespace mapping
}  // namespace pipelines
