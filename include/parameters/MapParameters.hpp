#pragma once

// Standard
#include <filesystem>
#include <vector>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "GeneralParameters.hpp"
#include "ParameterValidator.hpp"

namespace po = boost::program_options;

namespace pipelines::mapping {

struct MapParameters : public GeneralParameters {
   public:
    std::filesystem::path genomeIndexPath;
    std::vector<std::filesystem::path> peakFilePaths;
    bool classifyPeaks;

    MapParameters(const po::variables_map& params)
        : GeneralParameters(params),
          genomeIndexPath(ParameterValidator::validateFilePath(params, "garnetfile")),
          peakFilePaths(ParameterValidator::validateFilePaths(params, "peaks")),
          classifyPeaks(params["peaktype"].as<bool>()) {};
};

}  // namespace pipelines::mapping
