#pragma once

// Standard
#include <cstdint>
#include <string>

namespace dataTypes {

/**
 * @brief An interval with elevated signal reported by an epigenomic assay.
 *
 * Positions are taken from the peak file as written and treated as closed coordinates.
 */
struct Peak {
    std::string referenceID;
    int32_t startPosition;
    int32_t endPosition;
    std::string peakName;
    double peakScore;

    friend auto operator==(const Peak &, const Peak &) -> bool = default;
};

}  // namespace dataTypes
