#pragma once

// Standard
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "GeneralParameters.hpp"
#include "ParameterValidator.hpp"

namespace po = boost::program_options;

namespace pipelines::regression {

struct RegressParameters : public GeneralParameters {
   public:
    std::vector<std::filesystem::path> mappingPaths;
    std::filesystem::path expressionPath;
    size_t minimumSampleCount;

    // Within the complete pipeline the mapping comes from the map step and is not read from disk.
    RegressParameters(const po::variables_map& params, bool requireMapping = true)
        : GeneralParameters(params),
          mappingPaths(requireMapping ? ParameterValidator::validateFilePaths(params, "mapping")
                                      : std::vector<std::filesystem::path>{}),
          expressionPath(ParameterValidator::validateFilePath(params, "expression")),
          minimumSampleCount(
              ParameterValidator::validateArithmetic<size_t>(params, "minsamples", 3, SIZE_MAX)) {};
};

}  // namespace pipelines::regression
