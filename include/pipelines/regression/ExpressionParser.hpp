#pragma once

// Standard
#include <filesystem>
#include <string>

// Internal
#include "ExpressionRecord.hpp"

namespace pipelines::regression {

namespace fs = std::filesystem;

/**
 * @brief Reads the two-column expression table (geneSymbol, expression).
 *
 * The table has no header. Repeated gene symbols are kept in file order.
 */
class ExpressionParser {
   public:
    ExpressionParser() = delete;

    [[nodiscard]] static auto parse(const fs::path &expressionPath)
        -> dataTypes::ExpressionRecords;
    [[nodiscard]] static auto parseLine(const std::string &line, const std::string &location)
        -> dataTypes::ExpressionRecord;
};

}  // namespace pipelines::regression
