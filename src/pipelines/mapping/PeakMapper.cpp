#include "PeakMapper.hpp"

// Standard
#include <algorithm>
#include <functional>
#include <future>
#include <unordered_map>
#include <utility>

// Internal
#include "ChromosomeIndex.hpp"
#include "IntersectionEngine.hpp"
#include "Logger.hpp"
#include "MotifGeneTable.hpp"
#include "PeakParser.hpp"
#include "RelationshipClassifier.hpp"
#include "Utility.hpp"

using namespace dataTypes;

namespace pipelines::mapping {

auto PeakMapper::process(const MapData &data) const -> std::vector<MappingResult> {
    Logger::log(LogLevel::INFO, "Loading genome index ", parameters.genomeIndexPath.string());
    const auto genomeAnnotation = annotation::GenomeAnnotation::load(parameters.genomeIndexPath);

    std::vector<MappingResult> results;
    results.reserve(data.samples.size());

    const size_t batchSize = std::max<size_t>(parameters.threadCount, 1);

    for (size_t batchStart = 0; batchStart < data.samples.size(); batchStart += batchSize) {
        const size_t batchEnd = std::min(batchStart + batchSize, data.samples.size());

        std::vector<std::future<MappingResult>> futures;
        futures.reserve(batchEnd - batchStart);
        for (size_t i = batchStart; i < batchEnd; ++i) {
            futures.push_back(std::async(std::launch::async, &PeakMapper::processSample, this,
                                         std::cref(data.samples[i]), std::cref(genomeAnnotation)));
        }

        for (auto &future : futures) {
            results.push_back(future.get());
        }
    }

    return results;
}

auto PeakMapper::processSample(const MapSample &sample,
                               const annotation::GenomeAnnotation &genomeAnnotation) const
    -> MappingResult {
    Logger::log(LogLevel::INFO, "Processing sample: ", sample.input.sampleName);
    const helper::Timer timer{"Mapping " + sample.input.sampleName};

    const auto peaks = annotation::PeakParser::parse(sample.input.peakFilePath);
    Logger::log(LogLevel::INFO, "Parsed ", peaks.size(), " peaks from ",
                sample.input.peakFilePath.string());

    auto records = mapPeaks(genomeAnnotation, peaks, parameters.classifyPeaks);

    MotifGeneTable::write(records, sample.output.motifsAndGenesPath, parameters.classifyPeaks);

    return MappingResult{.sampleName = sample.input.sampleName, .records = std::move(records)};
}

auto PeakMapper::mapPeaks(const annotation::GenomeAnnotation &genomeAnnotation,
                          const std::vector<Peak> &peaks, bool classifyPeaks)
    -> MotifGeneRecords {
    const auto peakIndex = intervals::ChromosomeIndex<Peak>::build(peaks);

    const auto geneOverlaps =
        intervals::IntersectionEngine::intersect(peakIndex, genomeAnnotation.genes());
    const auto motifOverlaps =
        intervals::IntersectionEngine::intersect(peakIndex, genomeAnnotation.motifs());

    Logger::log(LogLevel::DEBUG, geneOverlaps.size(), " peaks overlap genes, ",
                motifOverlaps.size(), " peaks overlap motifs");

    std::unordered_map<const Peak *, const std::vector<const MotifFeature *> *> motifsByPeak;
    motifsByPeak.reserve(motifOverlaps.size());
    for (const auto &motifOverlap : motifOverlaps) {
        motifsByPeak.emplace(motifOverlap.query, &motifOverlap.matches);
    }

    MotifGeneRecords records;
    for (const auto &geneOverlap : geneOverlaps) {
        const auto motifs = motifsByPeak.find(geneOverlap.query);
        if (motifs == motifsByPeak.end()) {
            continue;
        }

        for (const GeneFeature *gene : geneOverlap.matches) {
            for (const MotifFeature *motif : *motifs->second) {
                auto record = MotifGeneRecord::fromOverlap(*geneOverlap.query, *gene, *motif);
                if (classifyPeaks) {
                    record.peakType = annotation::RelationshipClassifier::classify(record);
                }
                records.push_back(std::move(record));
            }
        }
    }

    Logger::log(LogLevel::INFO, "Found ", records.size(), " motif and gene pairs sharing a peak");

    return records;
}

}  // namespace pipelines::mapping
