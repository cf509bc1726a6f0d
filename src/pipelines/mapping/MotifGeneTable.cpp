#include "MotifGeneTable.hpp"

// Standard
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

// Internal
#include "Constants.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

using namespace dataTypes;

namespace pipelines::mapping {

namespace {

const std::vector<std::string> columnNames{"chrom",      "motifStart", "motifEnd",  "motifID",
                                           "motifName",  "motifScore", "geneName",  "geneSymbol",
                                           "geneStart",  "geneEnd",    "peakName"};

auto requirePosition(const std::string &token, const std::string &column,
                     const std::string &location) -> int32_t {
    const auto value = helper::toPosition(token);
    if (!value.has_value()) {
        throw errors::MalformedRecordError(location + ": " + column + " '" + token +
                                           "' is not an integer position");
    }
    return value.value();
}

}  // namespace

auto MotifGeneTable::header(bool withPeakType) -> std::string {
    std::string line;
    for (const auto &columnName : columnNames) {
        if (!line.empty()) {
            line += '\t';
        }
        line += columnName;
    }
    if (withPeakType) {
        line += '\t' + constants::mapping::peakTypeColumn;
    }
    return line;
}

auto MotifGeneTable::formatRecord(const MotifGeneRecord &record, bool withPeakType)
    -> std::string {
    std::ostringstream line;
    line << record.chrom << '\t' << record.motifStart << '\t' << record.motifEnd << '\t'
         << record.motifID << '\t' << record.motifName << '\t'
         << helper::formatDouble(record.motifScore) << '\t' << record.geneName << '\t'
         << record.geneSymbol << '\t' << record.geneStart << '\t' << record.geneEnd << '\t'
         << record.peakName;

    if (withPeakType) {
        line << '\t' << (record.peakType.has_value() ? toString(record.peakType.value()) : "");
    }
    return line.str();
}

void MotifGeneTable::write(const MotifGeneRecords &records, const fs::path &outPath,
                           bool withPeakType) {
    std::ofstream tableOut(outPath);
    if (!tableOut.is_open()) {
        throw std::runtime_error("Could not open file: " + outPath.string());
    }

    tableOut << header(withPeakType) << '\n';
    for (const auto &record : records) {
        tableOut << formatRecord(record, withPeakType) << '\n';
    }

    Logger::log(LogLevel::INFO, "Wrote ", records.size(), " motif and gene rows to ",
                outPath.string());
}

auto MotifGeneTable::parseLine(const std::string &line, const std::string &location)
    -> MotifGeneRecord {
    const auto tokens = helper::splitTabs(line);
    const size_t columnCount = constants::mapping::mappingColumnCount;

    if (tokens.size() != columnCount && tokens.size() != columnCount + 1) {
        throw errors::MalformedRecordError(location + ": expected " +
                                           std::to_string(columnCount) +
                                           " tab-separated columns, found " +
                                           std::to_string(tokens.size()));
    }

    const auto motifScore = helper::toDouble(tokens[5]);
    if (!motifScore.has_value()) {
        throw errors::MalformedRecordError(location + ": motifScore '" + tokens[5] +
                                           "' is not a number");
    }

    std::optional<PeakRelationship> peakType;
    if (tokens.size() > columnCount && !tokens[columnCount].empty()) {
        peakType = relationshipFromString(tokens[columnCount]);
        if (!peakType.has_value()) {
            throw errors::MalformedRecordError(location + ": unknown peak type '" +
                                               tokens[columnCount] + "'");
        }
    }

    return MotifGeneRecord{.chrom = tokens[0],
                           .motifStart = requirePosition(tokens[1], "motifStart", location),
                           .motifEnd = requirePosition(tokens[2], "motifEnd", location),
                           .motifID = tokens[3],
                           .motifName = tokens[4],
                           .motifScore = motifScore.value(),
                           .geneName = tokens[6],
                           .geneSymbol = tokens[7],
                           .geneStart = requirePosition(tokens[8], "geneStart", location),
                           .geneEnd = requirePosition(tokens[9], "geneEnd", location),
                           .peakName = tokens[10],
                           .peakStart = 0,
                           .peakEnd = 0,
                           .geneStrand = std::nullopt,
                           .peakType = peakType};
}

auto MotifGeneTable::read(const fs::path &inPath) -> MotifGeneRecords {
    std::ifstream tableIn(inPath);
    if (!tableIn.is_open()) {
        throw std::runtime_error("Could not open file: " + inPath.string());
    }

    MotifGeneRecords records;
    size_t lineNumber = 0;

    for (std::string line; std::getline(tableIn, line);) {
        ++lineNumber;
        if (line.empty() || line == "\r" || helper::hasPrefix(line, columnNames.front() + '\t')) {
            continue;
        }
        records.push_back(parseLine(line, inPath.string() + ":" + std::to_string(lineNumber)));
    }

    Logger::log(LogLevel::INFO, "Read ", records.size(), " motif and gene rows from ",
                inPath.string());

    return records;
}

}  // namespace pipelines::mapping
