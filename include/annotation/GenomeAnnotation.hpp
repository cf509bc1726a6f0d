#pragma once

// Standard
#include <filesystem>
#include <utility>
#include <vector>

// Boost
#include <boost/serialization/access.hpp>

// Internal
#include "ChromosomeIndex.hpp"
#include "GenomicFeature.hpp"

namespace annotation {

namespace fs = std::filesystem;

using GeneIndex = intervals::ChromosomeIndex<dataTypes::GeneFeature>;
using MotifIndex = intervals::ChromosomeIndex<dataTypes::MotifFeature>;

/**
 * @brief Genome side of the peak mapping: gene and motif intervals indexed by chromosome.
 *
 * Built once from the gene and motif tables, saved to disk and loaded for every peak file.
 * A loaded annotation is never modified.
 */
class GenomeAnnotation {
   public:
    GenomeAnnotation() = default;
    GenomeAnnotation(GeneIndex geneIndex, MotifIndex motifIndex)
        : geneIndex(std::move(geneIndex)), motifIndex(std::move(motifIndex)) {}

    static auto build(const std::vector<dataTypes::GeneFeature> &genes,
                      const std::vector<dataTypes::MotifFeature> &motifs) -> GenomeAnnotation;

    /**
     * @brief Reads an annotation written by save.
     * @throws errors::LoadError if the file is missing, unreadable or not a genome index.
     */
    static auto load(const fs::path &indexPath) -> GenomeAnnotation;

    void save(const fs::path &indexPath) const;

    [[nodiscard]] auto genes() const -> const GeneIndex & { return geneIndex; }
    [[nodiscard]] auto motifs() const -> const MotifIndex & { return motifIndex; }

   private:
    friend class boost::serialization::access;

    GeneIndex geneIndex;
    MotifIndex motifIndex;

    template <class Archive>
    void serialize(Archive &archive, const unsigned int /*version*/) {
        archive & geneIndex & motifIndex;
    }
};

}  // namespace annotation
