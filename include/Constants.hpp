#pragma once
// Standard
#include <cstddef>
#include <cstdint>
#include <string>

namespace constants::pipelines {
const std::string INDEX = "index";
const std::string MAP = "map";
const std::string REGRESS = "regress";
const std::string COMPLETE = "complete";

const std::string GENERAL_DESCRIPTION =
    "GarNet maps motifs and genes to peaks of epigenomic assays and relates motif strength to "
    "gene expression.\nRun GarNet with the subcall \"index\" once to build the genome index, then "
    "\"map\", \"regress\" or \"complete\" for every experiment.\n\nMinimum calls:\n  GarNet index "
    "--genes <gene-table> --motifs <motif-table> -o <output-dir>\n  GarNet complete -g "
    "<garnet-file> --peaks <peak-file> --expression <expression-file> -o <output-dir>\nOr run "
    "GarNet with a config file: GarNet complete -c <config-file>\n\nGeneral Options";
const std::string SUBCALL_DESCRIPTION =
    "The subcall to execute. The following subcalls are available: index, map, regress, "
    "complete.";

// General defaults
constexpr int defaultThreadCount = 1;

// Regress defaults
constexpr size_t defaultMinRegressionSamples = 5;
}  // namespace constants::pipelines

namespace constants::annotation {
constexpr size_t expectedGeneTableTokenCount = 6;
constexpr size_t expectedMotifTableTokenCount = 6;
constexpr size_t minPeakTokenCount = 5;
constexpr size_t maxPeakTokenCount = 12;
constexpr size_t expectedExpressionTokenCount = 2;

constexpr int32_t promoterDistance = 2000;

const std::string genomeIndexFileName = "genome.garnet";
const std::string genomeIndexFormatTag = "GARNET_GENOME_INDEX";
constexpr uint32_t genomeIndexFormatVersion = 2;
}  // namespace constants::annotation

namespace constants::mapping {
const std::string mappingFileSuffix = "_motifs_and_genes.tsv";
const std::string peakTypeColumn = "peakType";
constexpr size_t mappingColumnCount = 11;
}  // namespace constants::mapping

namespace constants::regression {
const std::string regressionFileSuffix = "_regression_results.tsv";
const std::string mappingSampleSuffix = "_motifs_and_genes";
}  // namespace constants::regression
