#include "GenomeAnnotation.hpp"

// Standard
#include <cstdint>
#include <fstream>
#include <new>
#include <stdexcept>
#include <string>

// Boost
#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/string.hpp>

// Internal
#include "Constants.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

using namespace constants::annotation;

namespace annotation {

auto GenomeAnnotation::build(const std::vector<dataTypes::GeneFeature> &genes,
                             const std::vector<dataTypes::MotifFeature> &motifs)
    -> GenomeAnnotation {
    GenomeAnnotation annotation{GeneIndex::build(genes), MotifIndex::build(motifs)};

    Logger::log(LogLevel::INFO, "Indexed ", annotation.geneIndex.recordCount(), " genes on ",
                annotation.geneIndex.chromosomes().size(), " chromosomes and ",
                annotation.motifIndex.recordCount(), " motifs on ",
                annotation.motifIndex.chromosomes().size(), " chromosomes");

    return annotation;
}

void GenomeAnnotation::save(const fs::path &indexPath) const {
    std::ofstream indexOut(indexPath, std::ios::binary);
    if (!indexOut.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + indexPath.string());
    }

    boost::archive::binary_oarchive archive(indexOut);

    const std::string formatTag = genomeIndexFormatTag;
    const uint32_t formatVersion = genomeIndexFormatVersion;
    archive << formatTag << formatVersion << *this;

    Logger::log(LogLevel::INFO, "Saved genome index to ", indexPath.string());
}

auto GenomeAnnotation::load(const fs::path &indexPath) -> GenomeAnnotation {
    if (!fs::is_regular_file(indexPath)) {
        throw errors::LoadError("Genome index not found: " + indexPath.string());
    }

    std::ifstream indexIn(indexPath, std::ios::binary);
    if (!indexIn.is_open()) {
        throw errors::LoadError("Could not open genome index: " + indexPath.string());
    }

    GenomeAnnotation annotation;
    try {
        boost::archive::binary_iarchive archive(indexIn);

        std::string formatTag;
        uint32_t formatVersion = 0;
        archive >> formatTag >> formatVersion;

        if (formatTag != genomeIndexFormatTag) {
            throw errors::LoadError(indexPath.string() + " is not a GarNet genome index");
        }
        if (formatVersion != genomeIndexFormatVersion) {
            throw errors::LoadError("Genome index " + indexPath.string() + " has format version " +
                                    std::to_string(formatVersion) + ", expected " +
                                    std::to_string(genomeIndexFormatVersion));
        }

        archive >> annotation;
    } catch (const boost::archive::archive_exception &e) {
        throw errors::LoadError("Genome index " + indexPath.string() +
                                " is corrupt: " + std::string(e.what()));
    } catch (const std::bad_alloc &e) {
        throw errors::LoadError("Genome index " + indexPath.string() +
                                " is corrupt: " + std::string(e.what()));
    } catch (const std::length_error &e) {
        throw errors::LoadError("Genome index " + indexPath.string() +
                                " is corrupt: " + std::string(e.what()));
    }

    Logger::log(LogLevel::INFO, "Loaded genome index with ", annotation.geneIndex.recordCount(),
                " genes and ", annotation.motifIndex.recordCount(), " motifs");

    return annotation;
}

}  // namespace annotation
