#pragma once

// Standard
#include <cstdint>
#include <string>

// Internal
#include "GenomicStrand.hpp"

namespace dataTypes {

struct GeneFeature {
    std::string referenceID;
    int32_t startPosition;
    int32_t endPosition;
    dataTypes::Strand strand;
    std::string geneName;
    std::string geneSymbol;

    template <class Archive>
    void serialize(Archive &archive, const unsigned int /*version*/) {
        archive & referenceID & startPosition & endPosition & strand & geneName & geneSymbol;
    }

    friend auto operator==(const GeneFeature &, const GeneFeature &) -> bool = default;
};

struct MotifFeature {
    std::string referenceID;
    int32_t startPosition;
    int32_t endPosition;
    std::string motifID;
    std::string motifName;
    double motifScore;

    template <class Archive>
    void serialize(Archive &archive, const unsigned int /*version*/) {
        archive & referenceID & startPosition & endPosition & motifID & motifName & motifScore;
    }

    friend auto operator==(const MotifFeature &, const MotifFeature &) -> bool = default;
};

}  // namespace dataTypes
