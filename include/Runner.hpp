#pragma once

// Standard
#include <filesystem>

// Internal
#include "CompleteParameters.hpp"
#include "IndexParameters.hpp"
#include "MapParameters.hpp"
#include "RegressParameters.hpp"

using namespace pipelines;

class Runner {
   public:
    Runner() = delete;
    Runner(const Runner&) = delete;
    Runner(Runner&&) = delete;
    auto operator=(const Runner&) -> Runner& = delete;
    auto operator=(Runner&&) -> Runner& = delete;
    ~Runner() = delete;

    static void runPipeline(int argc, const char* const argv[]);

   private:
    struct Pipeline {
        void operator()(const indexing::IndexParameters& params);
        void operator()(const mapping::MapParameters& params);
        void operator()(const regression::RegressParameters& params);
        void operator()(const CompleteParameters& params);
    };

    static void runIndexPipeline(const indexing::IndexParameters& parameters);
    static void runMapPipeline(const mapping::MapParameters& parameters);
    static void runRegressPipeline(const regression::RegressParameters& parameters);

    static void runCompletePipeline(const CompleteParameters& parameters);

    static void createOutputDirectory(const std::filesystem::path& outputDir);
};
