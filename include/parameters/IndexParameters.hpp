#pragma once

// Standard
#include <filesystem>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Constants.hpp"
#include "GeneralParameters.hpp"
#include "ParameterValidator.hpp"

namespace po = boost::program_options;

namespace pipelines::indexing {

struct IndexParameters : public GeneralParameters {
   public:
    std::filesystem::path geneTablePath;
    std::filesystem::path motifTablePath;
    std::filesystem::path genomeIndexOutPath;

    IndexParameters(const po::variables_map& params)
        : GeneralParameters(params),
          geneTablePath(ParameterValidator::validateFilePath(params, "genes")),
          motifTablePath(ParameterValidator::validateFilePath(params, "motifs")),
          genomeIndexOutPath(outputDir / constants::annotation::genomeIndexFileName) {};
};

}  // namespace pipelines::indexing
