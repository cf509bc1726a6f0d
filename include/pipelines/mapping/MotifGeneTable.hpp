#pragma once

// Standard
#include <filesystem>
#include <string>

// Internal
#include "MotifGeneRecord.hpp"

namespace pipelines::mapping {

namespace fs = std::filesystem;

/**
 * @brief Reads and writes the tab-separated motif and gene table produced by the map subcall.
 *
 * Columns: chrom, motifStart, motifEnd, motifID, motifName, motifScore, geneName, geneSymbol,
 * geneStart, geneEnd, peakName, and peakType when peaks were classified. The first line is
 * the header.
 */
class MotifGeneTable {
   public:
    MotifGeneTable() = delete;

    static void write(const dataTypes::MotifGeneRecords &records, const fs::path &outPath,
                      bool withPeakType);

    // Peak coordinates and gene strand are not part of the table and stay unset.
    [[nodiscard]] static auto read(const fs::path &inPath) -> dataTypes::MotifGeneRecords;

    [[nodiscard]] static auto header(bool withPeakType) -> std::string;
    [[nodiscard]] static auto formatRecord(const dataTypes::MotifGeneRecord &record,
                                           bool withPeakType) -> std::string;
    [[nodiscard]] static auto parseLine(const std::string &line, const std::string &location)
        -> dataTypes::MotifGeneRecord;
};

}  // namespace pipelines::mapping
