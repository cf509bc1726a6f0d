#pragma once

// Standard
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace dataTypes {

// Position of a peak relative to the transcription start site of a gene.
enum class PeakRelationship : uint8_t { UPSTREAM, PROMOTER, DOWNSTREAM };

inline auto toString(PeakRelationship relationship) -> std::string {
    switch (relationship) {
        case PeakRelationship::UPSTREAM:
            return "upstream";
        case PeakRelationship::PROMOTER:
            return "promoter";
        case PeakRelationship::DOWNSTREAM:
            return "downstream";
    }
    return "unknown";
}

inline auto relationshipFromString(const std::string &token) -> std::optional<PeakRelationship> {
    if (token == "upstream") {
        return PeakRelationship::UPSTREAM;
    }
    if (token == "promoter") {
        return PeakRelationship::PROMOTER;
    }
    if (token == "downstream") {
        return PeakRelationship::DOWNSTREAM;
    }
    return std::nullopt;
}

inline auto operator<<(std::ostream &stream, PeakRelationship relationship) -> std::ostream & {
    return stream << toString(relationship);
}

}  // namespace dataTypes
