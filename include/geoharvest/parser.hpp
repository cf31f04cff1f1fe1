#pragma once

#include "geoharvest/types.hpp"

#include <boost/json/value.hpp>

#include <filesystem>
#include <iosfwd>
#include <string>

namespace geoharvest {

    // Accepts a FeatureCollection, a single Feature or a bare geometry. Features with a null
    // geometry are skipped; provenance keys in the top-level "properties" are read when present.
    FeatureCollection ReadFeatureCollection(const std::filesystem::path &file);

    FeatureCollection ParseFeatureCollection(const std::string &text);

    // Nested arrays/objects become their serialized JSON text
    Scalar parseScalar(const boost::json::value &v);

    Properties parseProperties(const boost::json::value &props);

    std::ostream &operator<<(std::ostream &os, FeatureCollection const &fc);

} // namespace geoharvest
