#pragma once

#include <boost/json/value.hpp>
#include <datapod/datapod.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dp = ::datapod;

namespace geoharvest {

    // Axis-aligned envelope in WGS84 degrees (x = longitude, y = latitude)
    struct BBox {
        double xmin = 0.0;
        double ymin = 0.0;
        double xmax = 0.0;
        double ymax = 0.0;

        double width() const { return xmax - xmin; }
        double height() const { return ymax - ymin; }
        bool contains(double x, double y) const { return x >= xmin && x <= xmax && y >= ymin && y <= ymax; }
    };

    // Canonical geometry: coordinates are always WGS84 with x = lon, y = lat, z unused
    using LineString = std::vector<dp::Point>;
    using Ring = std::vector<dp::Point>;

    struct Polygon {
        std::vector<Ring> rings; // rings[0] is the outer ring
    };

    using Geometry = std::variant<dp::Point, LineString, Polygon>;

    using Scalar = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;
    using Properties = std::unordered_map<std::string, Scalar>;

    struct LayerDescriptor {
        std::string name;
        std::string url;
        std::optional<BBox> bbox;
        std::optional<std::string> crs;
        std::filesystem::path fallback;
    };

    struct PageCursor {
        std::size_t offset = 0;
        std::size_t size = 0;
    };

    struct GridCell {
        std::size_t row = 0;
        std::size_t col = 0;
        BBox envelope;
    };

    struct ChunkRequest {
        std::string layer;
        std::size_t index = 0;
        std::variant<GridCell, PageCursor> target;
        int attempt = 0;
    };

    // Server record as it came off the wire; the geometry stays in its native encoding
    struct RawFeature {
        boost::json::value geometry;
        Properties attributes;
    };

    struct Feature {
        Geometry geometry;
        Properties properties;
    };

    struct DropStats {
        std::size_t input = 0;
        std::size_t kept = 0;
        std::size_t decode_drops = 0;
        std::size_t reprojection_drops = 0;
        std::size_t axis_swapped = 0;
    };

    struct Provenance {
        std::string layer;
        std::string source_crs;
        std::string endpoint;
        std::string fetched_at; // ISO-8601 UTC
        bool complete = false;
        DropStats drops;
    };

    struct FeatureCollection {
        Provenance provenance;
        std::vector<Feature> features;
        std::unordered_map<std::string, std::string> global_properties; // extra top-level properties
    };

    std::string isoTimestamp(std::chrono::system_clock::time_point tp);

} // namespace geoharvest
