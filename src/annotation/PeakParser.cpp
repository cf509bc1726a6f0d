#include "PeakParser.hpp"

// Standard
#include <fstream>
#include <optional>
#include <stdexcept>

// Internal
#include "Constants.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

using namespace constants::annotation;

namespace annotation {

auto PeakParser::parse(const fs::path &peakFilePath) -> std::vector<dataTypes::Peak> {
    std::ifstream file(peakFilePath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + peakFilePath.string());
    }

    std::vector<dataTypes::Peak> peaks;
    size_t lineNumber = 0;

    for (std::string line; std::getline(file, line);) {
        ++lineNumber;
        if (isHeaderLine(line)) {
            continue;
        }
        peaks.push_back(parseLine(line, peakFilePath.string() + ":" + std::to_string(lineNumber)));
    }

    Logger::log(LogLevel::INFO, "Parsed ", peaks.size(), " peaks from ", peakFilePath.string());

    return peaks;
}

auto PeakParser::parseLine(const std::string &line, const std::string &location)
    -> dataTypes::Peak {
    const auto tokens = helper::splitTabs(line);

    if (tokens.size() < minPeakTokenCount || tokens.size() > maxPeakTokenCount) {
        throw errors::MalformedRecordError(
            location + ": expected " + std::to_string(minPeakTokenCount) + " to " +
            std::to_string(maxPeakTokenCount) + " tab-separated columns, found " +
            std::to_string(tokens.size()));
    }

    const std::optional<int32_t> peakStart = helper::toPosition(tokens[1]);
    const std::optional<int32_t> peakEnd = helper::toPosition(tokens[2]);
    if (!peakStart.has_value() || !peakEnd.has_value()) {
        throw errors::MalformedRecordError(location + ": peak coordinates '" + tokens[1] + "', '" +
                                           tokens[2] + "' are not integer positions");
    }

    const std::optional<double> peakScore = helper::toDouble(tokens[4]);
    if (!peakScore.has_value()) {
        throw errors::MalformedRecordError(location + ": peakScore '" + tokens[4] +
                                           "' is not a number");
    }

    return dataTypes::Peak{.referenceID = tokens[0],
                           .startPosition = peakStart.value(),
                           .endPosition = peakEnd.value(),
                           .peakName = tokens[3],
                           .peakScore = peakScore.value()};
}

auto PeakParser::isHeaderLine(const std::string &line) -> bool {
    return line.empty() || line == "\r" || line[0] == '#' || helper::hasPrefix(line, "track") ||
           helper::hasPrefix(line, "browser");
}

}  // namespace annotation
