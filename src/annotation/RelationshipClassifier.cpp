#include "RelationshipClassifier.hpp"

// Standard
#include <string>

// Internal
#include "Constants.hpp"
#include "Errors.hpp"

using constants::annotation::promoterDistance;

namespace annotation {

auto RelationshipClassifier::classify(const int32_t peakStart, const int32_t peakEnd,
                                      const int32_t geneStart, const int32_t geneEnd,
                                      const char strand) -> dataTypes::PeakRelationship {
    using dataTypes::PeakRelationship;

    // Distances may exceed the int32_t range
    if (strand == dataTypes::Strand::FORWARD) {
        const int64_t distance = static_cast<int64_t>(peakStart) - geneStart;
        if (distance <= -promoterDistance) {
            return PeakRelationship::UPSTREAM;
        }
        if (distance < 0) {
            return PeakRelationship::PROMOTER;
        }
        return PeakRelationship::DOWNSTREAM;
    }

    if (strand == dataTypes::Strand::REVERSE) {
        const int64_t distance = static_cast<int64_t>(peakEnd) - geneEnd;
        if (distance >= promoterDistance) {
            return PeakRelationship::UPSTREAM;
        }
        if (distance > 0) {
            return PeakRelationship::PROMOTER;
        }
        return PeakRelationship::DOWNSTREAM;
    }

    throw errors::InvalidStrandError("Cannot classify peak against gene on strand '" +
                                     std::string(1, strand) + "'");
}

auto RelationshipClassifier::classify(const dataTypes::MotifGeneRecord &record)
    -> dataTypes::PeakRelationship {
    if (!record.geneStrand.has_value()) {
        throw errors::InvalidStrandError("Gene " + record.geneName + " has no strand");
    }
    return classify(record.peakStart, record.peakEnd, record.geneStart, record.geneEnd,
                    static_cast<char>(record.geneStrand.value()));
}

}  // namespace annotation
