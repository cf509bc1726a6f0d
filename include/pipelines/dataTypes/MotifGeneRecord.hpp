#pragma once

// Standard
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Internal
#include "GenomicFeature.hpp"
#include "GenomicStrand.hpp"
#include "Peak.hpp"
#include "PeakRelationship.hpp"

namespace dataTypes {

/**
 * @brief A motif and a gene found together under one peak.
 *
 * One record is produced for every (gene, motif) pairing of a peak. The peak coordinates and
 * the gene strand are carried along so the record can be classified later, but they are not
 * part of the exported columns.
 */
struct MotifGeneRecord {
    std::string chrom;
    int32_t motifStart;
    int32_t motifEnd;
    std::string motifID;
    std::string motifName;
    double motifScore;
    std::string geneName;
    std::string geneSymbol;
    int32_t geneStart;
    int32_t geneEnd;
    std::string peakName;

    int32_t peakStart;
    int32_t peakEnd;
    std::optional<Strand> geneStrand;
    std::optional<PeakRelationship> peakType;

    static auto fromOverlap(const Peak &peak, const GeneFeature &gene, const MotifFeature &motif)
        -> MotifGeneRecord {
        return MotifGeneRecord{.chrom = peak.referenceID,
                               .motifStart = motif.startPosition,
                               .motifEnd = motif.endPosition,
                               .motifID = motif.motifID,
                               .motifName = motif.motifName,
                               .motifScore = motif.motifScore,
                               .geneName = gene.geneName,
                               .geneSymbol = gene.geneSymbol,
                               .geneStart = gene.startPosition,
                               .geneEnd = gene.endPosition,
                               .peakName = peak.peakName,
                               .peakStart = peak.startPosition,
                               .peakEnd = peak.endPosition,
                               .geneStrand = gene.strand,
                               .peakType = std::nullopt};
    }
};

using MotifGeneRecords = std::vector<MotifGeneRecord>;

}  // namespace dataTypes
