#include "ParameterParser.hpp"

#include <fstream>
#include <iostream>
#include <string>

#include "Constants.hpp"
#include "Logger.hpp"
#include "ParameterOptions.hpp"

namespace pipelines {
auto ParameterParser::getParameters(int argc, const char *const argv[])  // NOLINT
    -> ParameterParser::ParametersVariant {
    const auto params = parseParameters(argc, argv);

    const std::string subcall = params["subcall"].as<std::string>();

    if (subcall == constants::pipelines::COMPLETE) {
        return CompleteParameters{params};
    }
    if (subcall == constants::pipelines::INDEX) {
        return indexing::IndexParameters{params};
    }
    if (subcall == constants::pipelines::MAP) {
        return mapping::MapParameters{params};
    }
    if (subcall == constants::pipelines::REGRESS) {
        return regression::RegressParameters{params};
    }

    Logger::log(LogLevel::ERROR, "Unknown subcall: " + subcall);
    exit(EXIT_FAILURE);
}

auto ParameterParser::parseParameters(int argc,
                                      const char *const argv[]) -> po::variables_map {  // NOLINT
    const po::options_description commandLineOptions{getCommandLineOptions()};

    const po::positional_options_description positionalOptions{getPositionalOptions()};

    po::variables_map params;
    try {
        store(po::command_line_parser(argc, argv)
                  .options(commandLineOptions)
                  .positional(positionalOptions)
                  .run(),
              params);
    } catch (const po::error &e) {
        Logger::log(LogLevel::ERROR, "Invalid command line: ", std::string(e.what()));
    }

    notify(params);

    printVersion();

    if (params.count("version") != 0U) {
        exit(EXIT_SUCCESS);
    }

    if (params.count("help") != 0U) {
        std::cout << commandLineOptions << std::endl;
        exit(EXIT_SUCCESS);
    }

    if (params.count("subcall") == 0U) {
        Logger::log(LogLevel::ERROR, "Please provide a subcall.");
    }

    Logger::setLogLevel(params["loglevel"].as<std::string>());

    insertConfigFileParameters(params);

    return params;
}

void ParameterParser::insertConfigFileParameters(po::variables_map &params) {
    if (params.count("config") == 0) {
        return;
    }

    const po::options_description configFileOptions{getConfigFileOptions()};

    const std::string configFilePath{params["config"].as<std::string>()};

    std::ifstream configIn{configFilePath};

    if (!configIn) {
        Logger::log(LogLevel::ERROR, "Configuration file could not be opened!");
    }

    try {
        po::store(po::parse_config_file(configIn, configFileOptions), params);
    } catch (const po::error &e) {
        Logger::log(LogLevel::ERROR, "Invalid configuration file ", configFilePath, ": ",
                    std::string(e.what()));
    }
    notify(params);

    Logger::setLogLevel(params["loglevel"].as<std::string>());
}

auto ParameterParser::getCommandLineOptions() -> po::options_description {
    const po::options_description generalOptions{ParameterOptions::getGeneralOptions()};
    const po::options_description indexOptions{ParameterOptions::getIndexOptions()};
    const po::options_description mapOptions{ParameterOptions::getMapOptions()};
    const po::options_description regressOptions{ParameterOptions::getRegressOptions()};
    const po::options_description otherOptions{ParameterOptions::getOtherOptions()};
    const po::options_description subcallOptions{ParameterOptions::getSubcallOptions()};

    po::options_description commandLineOptions{"Command line options"};

    commandLineOptions.add(generalOptions)
        .add(indexOptions)
        .add(mapOptions)
        .add(regressOptions)
        .add(otherOptions)
        .add(subcallOptions);

    return commandLineOptions;
}

auto ParameterParser::getConfigFileOptions() -> po::options_description {
    const po::options_description generalOptions{ParameterOptions::getGeneralOptions()};
    const po::options_description indexOptions{ParameterOptions::getIndexOptions()};
    const po::options_description mapOptions{ParameterOptions::getMapOptions()};
    const po::options_description regressOptions{ParameterOptions::getRegressOptions()};

    po::options_description configFileOptions{"Config file options"};

    configFileOptions.add(generalOptions).add(indexOptions).add(mapOptions).add(regressOptions);

    return configFileOptions;
}

auto ParameterParser::getPositionalOptions() -> po::positional_options_description {
    po::positional_options_description positionalOptions;
    positionalOptions.add("subcall", 1);

    return positionalOptions;
}

void ParameterParser::printVersion() {
    const std::string versionString =
        "GarNet v" + std::to_string(GarNet_VERSION_MAJOR) + "." +
        std::to_string(GarNet_VERSION_MINOR) + "." + std::to_string(GarNet_VERSION_PATCH) + " - " +
        "Map transcription factor motifs and genes to epigenomic peaks.";

    Logger::log(LogLevel::INFO, versionString);
}

}  // namespace pipelines
