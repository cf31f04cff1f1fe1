#include "geoharvest/parser.hpp"
#include "geoharvest/error.hpp"
#include "geoharvest/normalizer.hpp"

#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace geoharvest {

    namespace op {
        boost::json::value wrapFeatureCollection(boost::json::value j) {
            if (!j.is_object() || !j.as_object().contains("type") || !j.as_object().at("type").is_string()) {
                throw std::runtime_error(
                    "geoharvest::ReadFeatureCollection(): top-level object has no string 'type' field");
            }

            auto type = std::string(j.as_object().at("type").as_string());
            if (type == "FeatureCollection") {
                return j;
            }
            if (type == "Feature") {
                boost::json::object fc;
                fc["type"] = "FeatureCollection";
                boost::json::array features;
                features.push_back(std::move(j));
                fc["features"] = std::move(features);
                return fc;
            }

            boost::json::object feat;
            feat["type"] = "Feature";
            feat["geometry"] = std::move(j);
            feat["properties"] = boost::json::object();
            boost::json::object fc;
            fc["type"] = "FeatureCollection";
            boost::json::array features;
            features.push_back(std::move(feat));
            fc["features"] = std::move(features);
            return fc;
        }

        std::size_t getCount(const boost::json::object &obj, const char *key) {
            if (!obj.contains(key) || !obj.at(key).is_number())
                return 0;
            return static_cast<std::size_t>(boost::json::value_to<double>(obj.at(key)));
        }
    } // namespace op

    using json = boost::json::value;

    Scalar parseScalar(const json &v) {
        switch (v.kind()) {
        case boost::json::kind::null:
            return nullptr;
        case boost::json::kind::bool_:
            return v.as_bool();
        case boost::json::kind::int64:
            return v.as_int64();
        case boost::json::kind::uint64:
            return static_cast<double>(v.as_uint64());
        case boost::json::kind::double_:
            return v.as_double();
        case boost::json::kind::string:
            return std::string(v.as_string());
        default:
            return boost::json::serialize(v);
        }
    }

    Properties parseProperties(const json &props) {
        Properties m;
        if (!props.is_object())
            return m;
        auto const &obj = props.as_object();
        m.reserve(obj.size());
        for (auto const &item : obj)
            m[std::string(item.key())] = parseScalar(item.value());
        return m;
    }

    FeatureCollection ParseFeatureCollection(const std::string &text) {
        boost::json::error_code ec;
        json parsed = boost::json::parse(text, ec);
        if (ec)
            throw std::runtime_error("geoharvest::ReadFeatureCollection(): invalid JSON: " + ec.message());

        auto fc_json = op::wrapFeatureCollection(std::move(parsed));
        auto const &fc_obj = fc_json.as_object();

        FeatureCollection fc;

        if (fc_obj.contains("properties") && fc_obj.at("properties").is_object()) {
            auto const &P = fc_obj.at("properties").as_object();
            for (const auto &[key, value] : P) {
                if (key == "layer" && value.is_string()) {
                    fc.provenance.layer = std::string(value.as_string());
                } else if (key == "source_crs" && value.is_string()) {
                    fc.provenance.source_crs = std::string(value.as_string());
                } else if (key == "endpoint" && value.is_string()) {
                    fc.provenance.endpoint = std::string(value.as_string());
                } else if (key == "fetched_at" && value.is_string()) {
                    fc.provenance.fetched_at = std::string(value.as_string());
                } else if (key == "complete" && value.is_bool()) {
                    fc.provenance.complete = value.as_bool();
                } else if (key == "features_input" || key == "dropped_geometry" || key == "dropped_reprojection" ||
                           key == "axis_swapped") {
                    continue;
                } else if (value.is_string()) {
                    fc.global_properties[std::string(key)] = std::string(value.as_string());
                } else {
                    fc.global_properties[std::string(key)] = boost::json::serialize(value);
                }
            }
            fc.provenance.drops.input = op::getCount(P, "features_input");
            fc.provenance.drops.decode_drops = op::getCount(P, "dropped_geometry");
            fc.provenance.drops.reprojection_drops = op::getCount(P, "dropped_reprojection");
            fc.provenance.drops.axis_swapped = op::getCount(P, "axis_swapped");
        }

        if (!fc_obj.contains("features") || !fc_obj.at("features").is_array())
            throw std::runtime_error("geoharvest::ReadFeatureCollection(): missing 'features' array");

        auto const &features = fc_obj.at("features").as_array();
        fc.features.reserve(features.size());
        std::size_t index = 0;
        for (auto const &feat : features) {
            ++index;
            if (!feat.is_object())
                throw std::runtime_error("geoharvest::ReadFeatureCollection(): feature " + std::to_string(index) +
                                         " is not an object");
            auto const &feat_obj = feat.as_object();
            if (!feat_obj.contains("geometry") || feat_obj.at("geometry").is_null())
                continue;

            Geometry geometry;
            try {
                geometry = decodeGeometry(feat_obj.at("geometry"));
            } catch (const HarvestError &e) {
                throw std::runtime_error("geoharvest::ReadFeatureCollection(): feature " + std::to_string(index) +
                                         ": " + e.what());
            }

            Properties props;
            if (feat_obj.contains("properties"))
                props = parseProperties(feat_obj.at("properties"));
            fc.features.push_back(Feature{std::move(geometry), std::move(props)});
        }

        fc.provenance.drops.kept = fc.features.size();
        return fc;
    }

    FeatureCollection ReadFeatureCollection(const std::filesystem::path &file) {
        std::ifstream ifs(file);
        if (!ifs) {
            throw std::runtime_error("geoharvest::ReadFeatureCollection(): cannot open \"" + file.string() + '\"');
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return ParseFeatureCollection(buffer.str());
    }

    std::ostream &operator<<(std::ostream &os, FeatureCollection const &fc) {
        os << "LAYER: " << fc.provenance.layer << "\n"
           << "CRS: " << fc.provenance.source_crs << "\n"
           << "COMPLETE: " << (fc.provenance.complete ? "yes" : "no") << "\n";
        os << "FEATURES: " << fc.features.size() << "\n";

        for (auto const &f : fc.features) {
            auto &v = f.geometry;
            if (std::get_if<Polygon>(&v)) {
                os << "  POLYGON\n";
            } else if (std::get_if<LineString>(&v)) {
                os << "  LINE\n";
            } else if (std::get_if<dp::Point>(&v)) {
                os << "   POINT\n";
            }
            if (f.properties.size() > 0)
                os << "    PROPS:" << f.properties.size() << "\n";
        }

        return os;
    }

} // namespace geoharvest
