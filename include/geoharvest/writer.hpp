#pragma once

#include "geoharvest/types.hpp"

#include <boost/json/value.hpp>

#include <filesystem>

namespace geoharvest {

    boost::json::value geometryToJson(Geometry const &geom);

    boost::json::value scalarToJson(Scalar const &value);

    boost::json::value featureToJson(Feature const &f);

    boost::json::value toJson(FeatureCollection const &fc);

    // Replaces outPath wholesale: writes a sibling temporary file and renames it into place.
    // Throws std::runtime_error when the file cannot be written.
    void WriteFeatureCollection(FeatureCollection const &fc, std::filesystem::path const &outPath);

} // namespace geoharvest
