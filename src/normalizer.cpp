#include "geoharvest/normalizer.hpp"

#include <boost/json.hpp>
#include <cmath>

namespace geoharvest {

    namespace {
        using json = boost::json::value;

        [[noreturn]] void fail(const std::string &msg) { throw HarvestError(ErrorKind::GeometryDecodeError, msg); }

        double number(const json &v) {
            if (!v.is_number())
                fail("coordinate is not a number");
            double d = boost::json::value_to<double>(v);
            if (!std::isfinite(d))
                fail("coordinate is not finite");
            return d;
        }

        dp::Point position(const json &v) {
            if (!v.is_array() || v.as_array().size() < 2)
                fail("position must be an array of at least two numbers");
            auto const &a = v.as_array();
            return dp::Point{number(a[0]), number(a[1]), 0.0};
        }

        LineString positions(const json &v, std::size_t minCount) {
            if (!v.is_array())
                fail("expected an array of positions");
            LineString pts;
            pts.reserve(v.as_array().size());
            for (auto const &p : v.as_array())
                pts.push_back(position(p));
            if (pts.size() < minCount)
                fail("expected at least " + std::to_string(minCount) + " positions, got " +
                     std::to_string(pts.size()));
            return pts;
        }

        const json &firstPart(const json &v, const char *what) {
            if (!v.is_array() || v.as_array().empty())
                fail(std::string(what) + " has no parts");
            return v.as_array()[0];
        }

        Polygon polygonFromRing(LineString pts) {
            if (pts.front().x != pts.back().x || pts.front().y != pts.back().y)
                pts.push_back(pts.front());
            if (pts.size() < 4)
                fail("polygon ring needs at least three distinct positions");
            Polygon poly;
            poly.rings.push_back(std::move(pts));
            return poly;
        }

        Geometry decodeEsri(const boost::json::object &obj) {
            if (obj.contains("x") || obj.contains("y")) {
                if (!obj.contains("x") || !obj.contains("y"))
                    fail("point needs both x and y");
                return dp::Point{number(obj.at("x")), number(obj.at("y")), 0.0};
            }
            if (obj.contains("paths"))
                return positions(firstPart(obj.at("paths"), "paths"), 2);
            if (obj.contains("rings"))
                return polygonFromRing(positions(firstPart(obj.at("rings"), "rings"), 3));
            fail("unrecognized Esri geometry");
        }

        Geometry decodeGeoJson(const boost::json::object &obj) {
            if (!obj.at("type").is_string())
                fail("geometry 'type' is not a string");
            auto type = std::string(obj.at("type").as_string());
            if (!obj.contains("coordinates"))
                fail(type + " without coordinates");
            auto const &coords = obj.at("coordinates");

            if (type == "Point")
                return position(coords);
            if (type == "LineString")
                return positions(coords, 2);
            if (type == "MultiLineString")
                return positions(firstPart(coords, "MultiLineString"), 2);
            if (type == "Polygon")
                return polygonFromRing(positions(firstPart(coords, "Polygon"), 3));
            if (type == "MultiPolygon")
                return polygonFromRing(
                    positions(firstPart(firstPart(coords, "MultiPolygon"), "MultiPolygon part"), 3));
            fail("unsupported geometry type '" + type + "'");
        }

        template <typename F> Geometry mapPoints(const Geometry &geom, F &&f) {
            return std::visit(
                [&](auto const &shape) -> Geometry {
                    using T = std::decay_t<decltype(shape)>;
                    if constexpr (std::is_same_v<T, dp::Point>) {
                        return f(shape);
                    } else if constexpr (std::is_same_v<T, LineString>) {
                        LineString out;
                        out.reserve(shape.size());
                        for (auto const &p : shape)
                            out.push_back(f(p));
                        return out;
                    } else {
                        Polygon out;
                        out.rings.reserve(shape.rings.size());
                        for (auto const &ring : shape.rings) {
                            Ring r;
                            r.reserve(ring.size());
                            for (auto const &p : ring)
                                r.push_back(f(p));
                            out.rings.push_back(std::move(r));
                        }
                        return out;
                    }
                },
                geom);
        }

        bool allInRange(const Geometry &geom) {
            bool ok = true;
            mapPoints(geom, [&](const dp::Point &p) {
                ok = ok && inWgs84Range(p);
                return p;
            });
            return ok;
        }
    } // namespace

    Geometry decodeGeometry(const json &native) {
        if (native.is_null())
            fail("feature has no geometry");
        if (!native.is_object())
            fail("geometry is not an object");
        auto const &obj = native.as_object();
        if (obj.contains("type"))
            return decodeGeoJson(obj);
        return decodeEsri(obj);
    }

    NormalizeOutcome normalizeFeature(const RawFeature &raw, const Transform &transform,
                                      const NormalizeOptions &options) {
        NormalizeOutcome out;

        Geometry projected;
        try {
            auto native = decodeGeometry(raw.geometry);
            projected = mapPoints(native, [&](const dp::Point &p) { return transform.forward(p); });
        } catch (const HarvestError &e) {
            out.dropped = e.kind();
            out.reason = e.what();
            return out;
        }

        if (!allInRange(projected)) {
            if (options.axisSwap) {
                auto swapped = mapPoints(projected, [](const dp::Point &p) { return dp::Point{p.y, p.x, 0.0}; });
                if (allInRange(swapped)) {
                    projected = std::move(swapped);
                    out.axisSwapped = true;
                }
            }
            if (!out.axisSwapped) {
                out.dropped = ErrorKind::ReprojectionError;
                out.reason = "coordinate outside WGS84 range after transform from " + transform.source();
                return out;
            }
        }

        out.feature = Feature{std::move(projected), raw.attributes};
        return out;
    }

    NormalizeResult normalizeFeatures(const std::vector<RawFeature> &raw, const Transform &transform,
                                      const NormalizeOptions &options, const Logger &log, const std::string &layer) {
        NormalizeResult result;
        result.stats.input = raw.size();
        result.features.reserve(raw.size());

        for (std::size_t i = 0; i < raw.size(); ++i) {
            auto outcome = normalizeFeature(raw[i], transform, options);
            if (outcome.kept()) {
                if (outcome.axisSwapped)
                    ++result.stats.axis_swapped;
                result.features.push_back(std::move(*outcome.feature));
                continue;
            }
            if (outcome.dropped == ErrorKind::GeometryDecodeError)
                ++result.stats.decode_drops;
            else
                ++result.stats.reprojection_drops;
            if (log)
                log->debug("[{}] feature {} dropped ({}): {}", layer, i, toString(*outcome.dropped), outcome.reason);
        }

        result.stats.kept = result.features.size();
        return result;
    }

} // namespace geoharvest
