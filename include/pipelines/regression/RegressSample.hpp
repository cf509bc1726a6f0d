#pragma once

// Standard
#include <filesystem>
#include <string>

// Internal
#include "MotifGeneRecord.hpp"

namespace pipelines {
namespace regression {
namespace fs = std::filesystem;

struct RegressSample {
    std::string sampleName;

    dataTypes::MotifGeneRecords motifsAndGenes;

    fs::path regressionResultsPath;
};

}  // namespace regression
}  // namespace pipelines
