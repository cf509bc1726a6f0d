#include "ExpressionParser.hpp"

// Standard
#include <fstream>
#include <stdexcept>

// Internal
#include "Constants.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

namespace pipelines::regression {

auto ExpressionParser::parseLine(const std::string &line, const std::string &location)
    -> dataTypes::ExpressionRecord {
    const auto tokens = helper::splitTabs(line);
    if (tokens.size() != constants::annotation::expectedExpressionTokenCount) {
        throw errors::MalformedRecordError(
            location + ": expected " +
            std::to_string(constants::annotation::expectedExpressionTokenCount) +
            " tab-separated columns, found " + std::to_string(tokens.size()));
    }

    if (tokens[0].empty()) {
        throw errors::MalformedRecordError(location + ": empty gene symbol");
    }

    const auto expression = helper::toDouble(tokens[1]);
    if (!expression.has_value()) {
        throw errors::MalformedRecordError(location + ": expression '" + tokens[1] +
                                           "' is not a number");
    }

    return dataTypes::ExpressionRecord{.geneSymbol = tokens[0], .expression = expression.value()};
}

auto ExpressionParser::parse(const fs::path &expressionPath) -> dataTypes::ExpressionRecords {
    std::ifstream expressionIn(expressionPath);
    if (!expressionIn.is_open()) {
        throw std::runtime_error("Could not open file: " + expressionPath.string());
    }

    dataTypes::ExpressionRecords records;
    size_t lineNumber = 0;

    for (std::string line; std::getline(expressionIn, line);) {
        ++lineNumber;
        if (line.empty() || line == "\r") {
            continue;
        }
        records.push_back(
            parseLine(line, expressionPath.string() + ":" + std::to_string(lineNumber)));
    }

    Logger::log(LogLevel::INFO, "Parsed ", records.size(), " expression values from ",
                expressionPath.string());

    return records;
}

}  // namespace pipelines::regression
