#pragma once

// Standard
#include <filesystem>
#include <string>
#include <vector>

// Internal
#include "GenomicFeature.hpp"

namespace annotation {

namespace fs = std::filesystem;

/**
 * @brief Reads the tab-delimited gene and motif tables the genome index is built from.
 *
 * Gene table columns: chrom, geneStart, geneEnd, geneName, geneSymbol, geneStrand.
 * Motif table columns: chrom, motifStart, motifEnd, motifID, motifName, motifScore.
 * Blank lines and lines starting with '#' are skipped. Any other line that does not match
 * the layout rejects the file with errors::MalformedRecordError.
 */
class FeatureParser {
   public:
    FeatureParser() = delete;

    [[nodiscard]] static auto parseGenes(const fs::path &geneTablePath)
        -> std::vector<dataTypes::GeneFeature>;
    [[nodiscard]] static auto parseMotifs(const fs::path &motifTablePath)
        -> std::vector<dataTypes::MotifFeature>;

    [[nodiscard]] static auto parseGeneLine(const std::string &line, const std::string &location)
        -> dataTypes::GeneFeature;
    [[nodiscard]] static auto parseMotifLine(const std::string &line, const std::string &location)
        -> dataTypes::MotifFeature;

   private:
    template <typename Record, typename LineParser>
    static auto iterateTable(const fs::path &tablePath, LineParser parseLine)
        -> std::vector<Record>;
};

}  // namespace annotation
