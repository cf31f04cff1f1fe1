#pragma once

#include "geoharvest/error.hpp"
#include "geoharvest/log.hpp"
#include "geoharvest/transform.hpp"
#include "geoharvest/types.hpp"

#include <boost/json/value.hpp>

#include <optional>
#include <string>
#include <vector>

namespace geoharvest {

    // Esri JSON ({x,y} / {paths} / {rings}) or GeoJSON ({type, coordinates}) -> canonical geometry.
    // Multi-part input keeps its first part; polygon rings are closed if open.
    // Throws HarvestError(GeometryDecodeError) for anything else.
    Geometry decodeGeometry(const boost::json::value &native);

    struct NormalizeOptions {
        bool axisSwap = false; // retry an out-of-range feature once with lon/lat swapped
    };

    struct NormalizeOutcome {
        std::optional<Feature> feature;
        std::optional<ErrorKind> dropped; // GeometryDecodeError or ReprojectionError
        std::string reason;
        bool axisSwapped = false;

        bool kept() const { return feature.has_value(); }
    };

    NormalizeOutcome normalizeFeature(const RawFeature &raw, const Transform &transform,
                                      const NormalizeOptions &options = {});

    struct NormalizeResult {
        std::vector<Feature> features;
        DropStats stats;
    };

    // Drops are counted by kind and logged at debug level
    NormalizeResult normalizeFeatures(const std::vector<RawFeature> &raw, const Transform &transform,
                                      const NormalizeOptions &options, const Logger &log, const std::string &layer);

} // namespace geoharvest
