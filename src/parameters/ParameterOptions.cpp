#include "ParameterOptions.hpp"

#include <boost/program_options/options_description.hpp>
#include <cstddef>
#include <string>
#include <vector>

#include "Constants.hpp"

namespace pi = constants::pipelines;

auto ParameterOptions::getSubcallOptions() -> po::options_description {
    po::options_description subcall("Subcall");
    subcall.add_options()("subcall", po::value<std::string>(), pi::SUBCALL_DESCRIPTION.c_str());

    return subcall;
}

auto ParameterOptions::getGeneralOptions() -> po::options_description {
    po::options_description general(pi::GENERAL_DESCRIPTION);
    general.add_options()("outdir,o", po::value<std::string>(),
                          "(output) folder in which the results are stored (required)");
    general.add_options()("loglevel", po::value<std::string>()->default_value("info"),
                          "log level [debug, info, warning, error] (default: info)");
    general.add_options()("threads,p", po::value<int>()->default_value(pi::defaultThreadCount),
                          "max number of peak files processed in parallel (default: 1)");

    return general;
}

auto ParameterOptions::getIndexOptions() -> po::options_description {
    po::options_description index("Index Pipeline");
    index.add_options()("genes", po::value<std::string>(),
                        "tab-separated gene table: chrom, start, end, name, symbol, strand "
                        "(required)");
    index.add_options()("motifs", po::value<std::string>(),
                        "tab-separated motif table: chrom, start, end, motif ID, motif name, "
                        "score (required)");

    return index;
}

auto ParameterOptions::getMapOptions() -> po::options_description {
    po::options_description map("Map Pipeline");
    map.add_options()("garnetfile,g", po::value<std::string>(),
                      "genome index built by the index subcall (required)");
    map.add_options()("peaks", po::value<std::vector<std::string>>()->composing(),
                      "BED file of peaks from an epigenomic assay, may be given several times "
                      "(required)");
    map.add_options()("peaktype", po::bool_switch()->default_value(false),
                      "annotate every row with the position of the peak relative to the gene "
                      "[upstream, promoter, downstream] (default: false)");

    return map;
}

auto ParameterOptions::getRegressOptions() -> po::options_description {
    po::options_description regress("Regress Pipeline");
    regress.add_options()("mapping", po::value<std::vector<std::string>>()->composing(),
                          "motif and gene table written by the map subcall, may be given several "
                          "times (required for regress)");
    regress.add_options()("expression,e", po::value<std::string>(),
                          "tab-separated expression table: gene symbol, expression (required)");
    regress.add_options()(
        "minsamples", po::value<size_t>()->default_value(pi::defaultMinRegressionSamples),
        "minimum number of genes associated with a transcription factor to fit a regression "
        "(default: 5)");

    return regress;
}

auto ParameterOptions::getOtherOptions() -> po::options_description {
    po::options_description other("Other");
    other.add_options()("version,v", "display the version number");
    other.add_options()("help,h", "display this help message");
    other.add_options()("config,c", po::value<std::string>(),
                        "configuration file that contains the parameters");

    return other;
}
