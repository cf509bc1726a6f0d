#include "Runner.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

#include "Errors.hpp"
#include "GenomeIndexer.hpp"
#include "Logger.hpp"
#include "MapData.hpp"
#include "ParameterParser.hpp"
#include "PeakMapper.hpp"
#include "RegressData.hpp"
#include "RegressionDriver.hpp"

void Runner::runPipeline(int argc, const char *const argv[]) {  // NOLINT
    const auto parameters = ParameterParser::getParameters(argc, argv);

    try {
        std::visit(Pipeline(), parameters);
    } catch (const errors::LoadError &e) {
        Logger::log(LogLevel::ERROR, "Unable to load genome index: ", e.what());
    } catch (const errors::MalformedRecordError &e) {
        Logger::log(LogLevel::ERROR, "Malformed input: ", e.what());
    } catch (const std::exception &e) {
        Logger::log(LogLevel::ERROR, e.what());
    }

    Logger::log(LogLevel::INFO, "Done");
}

void Runner::runIndexPipeline(const indexing::IndexParameters &parameters) {
    Logger::log(LogLevel::INFO, "Running index pipeline");

    createOutputDirectory(parameters.outputDir);

    const auto pipeline = indexing::GenomeIndexer(parameters);
    pipeline.process();
}

void Runner::runMapPipeline(const mapping::MapParameters &parameters) {
    Logger::log(LogLevel::INFO, "Running map pipeline");

    createOutputDirectory(parameters.outputDir);

    const auto data = mapping::MapData(parameters.outputDir, parameters.peakFilePaths);

    const auto pipeline = mapping::PeakMapper(parameters);
    const auto results = pipeline.process(data);

    Logger::log(LogLevel::INFO, "Mapped ", results.size(), " peak files");
}

void Runner::runRegressPipeline(const regression::RegressParameters &parameters) {
    Logger::log(LogLevel::INFO, "Running regress pipeline");

    createOutputDirectory(parameters.outputDir);

    const auto data =
        regression::RegressData::fromMappingFiles(parameters.outputDir, parameters.mappingPaths);

    const auto pipeline = regression::RegressionDriver(parameters);
    pipeline.process(data);
}

void Runner::runCompletePipeline(const CompleteParameters &parameters) {
    Logger::log(LogLevel::INFO, "Running complete pipeline");

    const auto &mapParameters = parameters.mapParameters;
    createOutputDirectory(mapParameters.outputDir);

    const auto mapData = mapping::MapData(mapParameters.outputDir, mapParameters.peakFilePaths);
    auto mappingResults = mapping::PeakMapper(mapParameters).process(mapData);

    const auto regressData = regression::RegressData::fromMappingResults(
        parameters.regressParameters.outputDir, std::move(mappingResults));

    const auto pipeline = regression::RegressionDriver(parameters.regressParameters);
    pipeline.process(regressData);
}

void Runner::createOutputDirectory(const std::filesystem::path &outputDir) {
    std::error_code errorCode;
    std::filesystem::create_directories(outputDir, errorCode);
    if (errorCode) {
        Logger::log(LogLevel::ERROR, "Could not create output directory ", outputDir.string(), ": ",
                    errorCode.message());
    }
}

void Runner::Pipeline::operator()(const indexing::IndexParameters &params) {
    Runner::runIndexPipeline(params);
};
void Runner::Pipeline::operator()(const mapping::MapParameters &params) {
    Runner::runMapPipeline(params);
};
void Runner::Pipeline::operator()(const regression::RegressParameters &params) {
    Runner::runRegressPipeline(params);
};
void Runner::Pipeline::operator()(const CompleteParameters &params) {
    Runner::runCompletePipeline(params);
};
