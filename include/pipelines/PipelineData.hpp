#pragma once

// Standard
#include <filesystem>
#include <set>
#include <string>
#include <vector>

// Internal
#include "Logger.hpp"

namespace pipelines {

namespace fs = std::filesystem;

struct PipelineData {
   protected:
    static auto getSampleName(const fs::path &filePath) -> std::string {
        return filePath.stem().string();
    }

    // Samples sharing a name would overwrite each other's output files.
    static void warnOnDuplicateSampleNames(const std::vector<fs::path> &filePaths) {
        std::set<std::string> sampleNames;
        for (const auto &filePath : filePaths) {
            if (!sampleNames.insert(getSampleName(filePath)).second) {
                Logger::log(LogLevel::WARNING, "Sample name ", getSampleName(filePath),
                            " is used by more than one input file, results will be overwritten");
            }
        }
    }
};
}  // namespace pipelines
