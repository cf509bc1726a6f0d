#pragma once

// Standard
#include <climits>
#include <cstddef>
#include <filesystem>
#include <string>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Classes
#include "Logger.hpp"
#include "ParameterValidator.hpp"

namespace po = boost::program_options;
class GeneralParameters {
   public:
    std::filesystem::path outputDir;

    LogLevel logLevel;

    size_t threadCount;

    GeneralParameters(const po::variables_map& params)
        : outputDir(ParameterValidator::validateOutputDirectory(params, "outdir")),
          logLevel(validateLogLevel(params)),
          threadCount(ParameterValidator::validateArithmetic(params, "threads", 1, INT_MAX)) {};

   private:
    static LogLevel validateLogLevel(const po::variables_map& params) {
        const std::string logLevelStr = params["loglevel"].as<std::string>();

        const auto logLevel = Logger::parseLogLevel(logLevelStr);
        if (!logLevel.has_value()) {
            Logger::log(LogLevel::ERROR, "Invalid log level specified: ", logLevelStr);
            return LogLevel::INFO;
        }
        return logLevel.value();
    }
};
