#pragma once

// Standard
#include <filesystem>
#include <string>
#include <vector>

// Internal
#include "Peak.hpp"

namespace annotation {

namespace fs = std::filesystem;

/**
 * @brief Reads BED-like peak files (chrom, peakStart, peakEnd, peakName, peakScore, ...).
 *
 * Up to twelve columns are accepted, only the first five are used. Blank lines, comments and
 * track/browser header lines are skipped.
 */
class PeakParser {
   public:
    PeakParser() = delete;

    [[nodiscard]] static auto parse(const fs::path &peakFilePath) -> std::vector<dataTypes::Peak>;
    [[nodiscard]] static auto parseLine(const std::string &line, const std::string &location)
        -> dataTypes::Peak;

   private:
    [[nodiscard]] static auto isHeaderLine(const std::string &line) -> bool;
};

}  // namespace annotation
