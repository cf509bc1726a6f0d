#pragma once

// Standard
#include <utility>

// Internal
#include "GenomeAnnotation.hpp"
#include "IndexParameters.hpp"

namespace pipelines::indexing {

/**
 * @brief Builds the genome index from the gene and motif tables and writes it to disk.
 *
 * The written file is the input of every subsequent map run.
 */
class GenomeIndexer {
   public:
    explicit GenomeIndexer(IndexParameters params) : parameters(std::move(params)) {};

    void process() const;

    [[nodiscard]] auto buildAnnotation() const -> annotation::GenomeAnnotation;

   private:
    IndexParameters parameters;
};

}  // namespace pipelines::indexing
