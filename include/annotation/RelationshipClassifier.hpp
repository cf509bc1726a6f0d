#pragma once

// Standard
#include <cstdint>

// Internal
#include "MotifGeneRecord.hpp"
#include "PeakRelationship.hpp"

namespace annotation {

class RelationshipClassifier {
   public:
    RelationshipClassifier() = delete;

    /**
     * @brief Places a peak relative to the transcription start site of a gene.
     *
     * Forward strand genes compare peakStart with geneStart, reverse strand genes compare
     * peakEnd with geneEnd. Peaks at least promoterDistance before the start site are
     * upstream, peaks closer than that but still before it are promoter peaks, everything
     * else is downstream.
     *
     * @param strand Gene strand, '+' or '-'.
     * @throws errors::InvalidStrandError for any other strand character.
     */
    [[nodiscard]] static auto classify(int32_t peakStart, int32_t peakEnd, int32_t geneStart,
                                       int32_t geneEnd, char strand)
        -> dataTypes::PeakRelationship;

    // Classifies the peak and gene of a mapped record.
    [[nodiscard]] static auto classify(const dataTypes::MotifGeneRecord &record)
        -> dataTypes::PeakRelationship;
};

}  // namespace annotation
