#pragma once

#include "geoharvest/crs.hpp"
#include "geoharvest/fetcher.hpp"
#include "geoharvest/log.hpp"
#include "geoharvest/normalizer.hpp"
#include "geoharvest/types.hpp"

#include <filesystem>
#include <string>

namespace geoharvest {

    enum class AssemblyStatus { Assembled, Empty };

    struct Assembly {
        AssemblyStatus status = AssemblyStatus::Empty;
        std::filesystem::path path; // set only when Assembled
        FeatureCollection collection;
    };

    // Output location of one layer
    std::filesystem::path layerOutputPath(const std::filesystem::path &outputDir, const std::string &layer);

    FeatureCollection buildCollection(const LayerDescriptor &layer, const ResolvedCrs &crs, NormalizeResult normalized,
                                      const LayerFetch &fetch, const std::string &fetchedAt);

    // Writes <outputDir>/<layer>.geojson unless the layer produced no features.
    // Throws HarvestError(OutputError) when the file cannot be written.
    Assembly assemble(const LayerDescriptor &layer, const ResolvedCrs &crs, NormalizeResult normalized,
                      const LayerFetch &fetch, const std::filesystem::path &outputDir, const std::string &fetchedAt,
                      const Logger &log);

} // namespace geoharvest
