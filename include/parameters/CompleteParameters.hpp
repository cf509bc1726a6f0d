#pragma once

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "MapParameters.hpp"
#include "RegressParameters.hpp"

namespace po = boost::program_options;

namespace pipelines {
struct CompleteParameters {
    mapping::MapParameters mapParameters;
    regression::RegressParameters regressParameters;

    CompleteParameters(const po::variables_map &params)
        : mapParameters(params), regressParameters(params, false) {};
};

}  // namespace pipelines
