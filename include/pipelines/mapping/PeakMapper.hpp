#pragma once

// Standard
#include <string>
#include <utility>
#include <vector>

// Internal
#include "GenomeAnnotation.hpp"
#include "MapData.hpp"
#include "MapParameters.hpp"
#include "MotifGeneRecord.hpp"
#include "Peak.hpp"

namespace pipelines::mapping {

struct MappingResult {
    std::string sampleName;
    dataTypes::MotifGeneRecords records;
};

/**
 * @brief Finds the motifs and genes that share a peak.
 *
 * Every peak file is intersected with the genes and with the motifs of the genome index.
 * Each peak contributes the cross product of its overlapping genes and motifs, a peak
 * without genes or without motifs contributes nothing.
 */
class PeakMapper {
   public:
    explicit PeakMapper(MapParameters params) : parameters(std::move(params)) {};

    /**
     * @brief Loads the genome index and maps every sample, writing one table per sample.
     *
     * At most threadCount peak files are mapped at the same time. Results keep the order of
     * the samples.
     *
     * @throws errors::LoadError if the genome index cannot be read.
     * @throws errors::MalformedRecordError if a peak file contains an invalid row.
     */
    [[nodiscard]] auto process(const MapData &data) const -> std::vector<MappingResult>;

    [[nodiscard]] static auto mapPeaks(const annotation::GenomeAnnotation &genomeAnnotation,
                                       const std::vector<dataTypes::Peak> &peaks,
                                       bool classifyPeaks) -> dataTypes::MotifGeneRecords;

   private:
    MapParameters parameters;

    [[nodiscard]] auto processSample(const MapSample &sample,
                                     const annotation::GenomeAnnotation &genomeAnnotation) const
        -> MappingResult;
};

}  // namespace pipelines::mapping
