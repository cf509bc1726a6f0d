#include "GenomeIndexer.hpp"

#include "FeatureParser.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

namespace pipelines::indexing {

void GenomeIndexer::process() const {
    const helper::Timer timer{"Genome indexing"};

    const auto annotation = buildAnnotation();

    annotation.save(parameters.genomeIndexOutPath);

    Logger::log(LogLevel::INFO, "Genome index written to ",
                parameters.genomeIndexOutPath.string());
}

auto GenomeIndexer::buildAnnotation() const -> annotation::GenomeAnnotation {
    Logger::log(LogLevel::INFO, "Parsing gene table ", parameters.geneTablePath.string());
    const auto genes = annotation::FeatureParser::parseGenes(parameters.geneTablePath);

    Logger::log(LogLevel::INFO, "Parsing motif table ", parameters.motifTablePath.string());
    const auto motifs = annotation::FeatureParser::parseMotifs(parameters.motifTablePath);

    return annotation::GenomeAnnotation::build(genes, motifs);
}

}  // namespace pipelines::indexing
