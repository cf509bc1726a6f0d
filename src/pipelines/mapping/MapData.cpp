#include "MapData.hpp"

#include "Constants.hpp"

namespace pipelines::mapping {
MapData::MapData(const fs::path &outputDir, const std::vector<fs::path> &peakFilePaths) {
    warnOnDuplicateSampleNames(peakFilePaths);

    samples.reserve(peakFilePaths.size());
    for (const auto &peakFilePath : peakFilePaths) {
        const std::string sampleName = getSampleName(peakFilePath);

        const MapInput input{.sampleName = sampleName, .peakFilePath = peakFilePath};
        const MapOutput output{.motifsAndGenesPath =
                                   outputDir / (sampleName + constants::mapping::mappingFileSuffix)};

        samples.push_back(MapSample{.input = input, .output = output});
    }
}
}  // namespace pipelines::mapping
