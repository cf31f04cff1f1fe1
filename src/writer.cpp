#include "geoharvest/writer.hpp"

#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace geoharvest {

    boost::json::value geometryToJson(Geometry const &geom) {
        auto ptCoords = [](dp::Point const &p) -> boost::json::array {
            boost::json::array arr;
            arr.push_back(p.x);
            arr.push_back(p.y);
            return arr;
        };

        return std::visit(
            [&](auto const &shape) -> boost::json::value {
                using T = std::decay_t<decltype(shape)>;
                boost::json::object j;
                if constexpr (std::is_same_v<T, dp::Point>) {
                    j["type"] = "Point";
                    j["coordinates"] = ptCoords(shape);
                } else if constexpr (std::is_same_v<T, LineString>) {
                    j["type"] = "LineString";
                    boost::json::array arr;
                    for (auto const &p : shape)
                        arr.push_back(ptCoords(p));
                    j["coordinates"] = std::move(arr);
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    j["type"] = "Polygon";
                    boost::json::array rings;
                    for (auto const &r : shape.rings) {
                        boost::json::array ring;
                        for (auto const &p : r)
                            ring.push_back(ptCoords(p));
                        rings.push_back(std::move(ring));
                    }
                    j["coordinates"] = std::move(rings);
                }
                return j;
            },
            geom);
    }

    boost::json::value scalarToJson(Scalar const &value) {
        return std::visit(
            [](auto const &v) -> boost::json::value {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    return nullptr;
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return boost::json::string(v);
                } else {
                    return v;
                }
            },
            value);
    }

    boost::json::value featureToJson(Feature const &f) {
        boost::json::object j;
        j["type"] = "Feature";
        boost::json::object props;
        for (auto const &kv : f.properties)
            props[kv.first] = scalarToJson(kv.second);
        j["properties"] = std::move(props);
        j["geometry"] = geometryToJson(f.geometry);
        return j;
    }

    boost::json::value toJson(FeatureCollection const &fc) {
        boost::json::object j;
        j["type"] = "FeatureCollection";

        {
            boost::json::object P;
            auto const &prov = fc.provenance;
            P["layer"] = prov.layer;
            P["source_crs"] = prov.source_crs;
            P["endpoint"] = prov.endpoint;
            P["fetched_at"] = prov.fetched_at;
            P["complete"] = prov.complete;
            P["features_input"] = static_cast<std::uint64_t>(prov.drops.input);
            P["dropped_geometry"] = static_cast<std::uint64_t>(prov.drops.decode_drops);
            P["dropped_reprojection"] = static_cast<std::uint64_t>(prov.drops.reprojection_drops);
            P["axis_swapped"] = static_cast<std::uint64_t>(prov.drops.axis_swapped);

            for (const auto &[key, value] : fc.global_properties) {
                P[key] = value;
            }

            j["properties"] = std::move(P);
        }

        boost::json::array features;
        features.reserve(fc.features.size());
        for (auto const &f : fc.features)
            features.push_back(featureToJson(f));
        j["features"] = std::move(features);

        return j;
    }

    void WriteFeatureCollection(FeatureCollection const &fc, std::filesystem::path const &outPath) {
        auto j = toJson(fc);
        auto tmp = outPath;
        tmp += ".tmp";
        {
            std::ofstream ofs(tmp);
            if (!ofs)
                throw std::runtime_error("Cannot open for write: " + outPath.string());
            ofs << boost::json::serialize(j) << "\n";
            if (!ofs)
                throw std::runtime_error("Write failed: " + outPath.string());
        }

        std::error_code ec;
        std::filesystem::rename(tmp, outPath, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("Cannot replace " + outPath.string());
        }
    }

} // namespace geoharvest
