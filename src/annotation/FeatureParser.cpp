#include "FeatureParser.hpp"

// Standard
#include <fstream>
#include <optional>
#include <stdexcept>

// Internal
#include "Constants.hpp"
#include "Errors.hpp"
#include "GenomicStrand.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

using namespace constants::annotation;

namespace annotation {

namespace {

auto requirePosition(const std::string &token, const std::string &column,
                     const std::string &location) -> int32_t {
    const auto value = helper::toPosition(token);
    if (!value.has_value()) {
        throw errors::MalformedRecordError(location + ": " + column + " '" + token +
                                           "' is not an integer position");
    }
    return value.value();
}

void requireTokenCount(const std::vector<std::string> &tokens, size_t expected,
                       const std::string &location) {
    if (tokens.size() != expected) {
        throw errors::MalformedRecordError(location + ": expected " + std::to_string(expected) +
                                           " tab-separated columns, found " +
                                           std::to_string(tokens.size()));
    }
}

}  // namespace

template <typename Record, typename LineParser>
auto FeatureParser::iterateTable(const fs::path &tablePath, LineParser parseLine)
    -> std::vector<Record> {
    std::ifstream file(tablePath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + tablePath.string());
    }

    std::vector<Record> records;
    size_t lineNumber = 0;

    for (std::string line; std::getline(file, line);) {
        ++lineNumber;
        if (line.empty() || line[0] == '#' || line == "\r") {
            continue;
        }

        records.push_back(parseLine(line, tablePath.string() + ":" + std::to_string(lineNumber)));
    }

    return records;
}

auto FeatureParser::parseGenes(const fs::path &geneTablePath)
    -> std::vector<dataTypes::GeneFeature> {
    auto genes = iterateTable<dataTypes::GeneFeature>(geneTablePath, &FeatureParser::parseGeneLine);
    Logger::log(LogLevel::INFO, "Parsed ", genes.size(), " genes from ", geneTablePath.string());
    return genes;
}

auto FeatureParser::parseMotifs(const fs::path &motifTablePath)
    -> std::vector<dataTypes::MotifFeature> {
    auto motifs =
        iterateTable<dataTypes::MotifFeature>(motifTablePath, &FeatureParser::parseMotifLine);
    Logger::log(LogLevel::INFO, "Parsed ", motifs.size(), " motifs from ",
                motifTablePath.string());
    return motifs;
}

auto FeatureParser::parseGeneLine(const std::string &line, const std::string &location)
    -> dataTypes::GeneFeature {
    const auto tokens = helper::splitTabs(line);
    requireTokenCount(tokens, expectedGeneTableTokenCount, location);

    dataTypes::Strand strand{};
    try {
        strand = dataTypes::strandFromString(tokens[5]);
    } catch (const errors::InvalidStrandError &e) {
        throw errors::MalformedRecordError(location + ": " + e.what());
    }

    return dataTypes::GeneFeature{.referenceID = tokens[0],
                                  .startPosition = requirePosition(tokens[1], "geneStart", location),
                                  .endPosition = requirePosition(tokens[2], "geneEnd", location),
                                  .strand = strand,
                                  .geneName = tokens[3],
                                  .geneSymbol = tokens[4]};
}

auto FeatureParser::parseMotifLine(const std::string &line, const std::string &location)
    -> dataTypes::MotifFeature {
    const auto tokens = helper::splitTabs(line);
    requireTokenCount(tokens, expectedMotifTableTokenCount, location);

    const std::optional<double> motifScore = helper::toDouble(tokens[5]);
    if (!motifScore.has_value()) {
        throw errors::MalformedRecordError(location + ": motifScore '" + tokens[5] +
                                           "' is not a number");
    }

    return dataTypes::MotifFeature{
        .referenceID = tokens[0],
        .startPosition = requirePosition(tokens[1], "motifStart", location),
        .endPosition = requirePosition(tokens[2], "motifEnd", location),
        .motifID = tokens[3],
        .motifName = tokens[4],
        .motifScore = motifScore.value()};
}

}  // namespace annotation
