#pragma once

// Standard
#include <string>
#include <vector>

namespace dataTypes {

// Expression score of one gene from a transcriptomics assay.
struct ExpressionRecord {
    std::string geneSymbol;
    double expression;

    friend auto operator==(const ExpressionRecord &, const ExpressionRecord &) -> bool = default;
};

using ExpressionRecords = std::vector<ExpressionRecord>;

}  // namespace dataTypes
