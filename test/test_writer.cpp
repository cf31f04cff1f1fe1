#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "geoharvest/geoharvest.hpp"
#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {
    geoharvest::FeatureCollection sampleCollection() {
        geoharvest::FeatureCollection fc;
        fc.provenance.layer = "WV_wells";
        fc.provenance.source_crs = "EPSG:3857";
        fc.provenance.endpoint = "https://example.test/arcgis/rest/services/wells/MapServer/0/query";
        fc.provenance.fetched_at = "2026-01-02T03:04:05Z";
        fc.provenance.complete = true;
        fc.provenance.drops = geoharvest::DropStats{4, 3, 1, 0, 0};

        geoharvest::Properties pointProps;
        pointProps["name"] = std::string("well 17");
        pointProps["api"] = std::int64_t{4700112345};
        pointProps["depth"] = 1234.5;
        pointProps["active"] = true;
        pointProps["operator"] = nullptr;
        fc.features.push_back(geoharvest::Feature{dp::Point{-80.1, 38.2, 0.0}, pointProps});

        geoharvest::LineString line{dp::Point{-80.0, 38.0, 0.0}, dp::Point{-80.5, 38.5, 0.0}};
        fc.features.push_back(geoharvest::Feature{line, {{"name", std::string("pipeline")}}});

        geoharvest::Polygon poly;
        poly.rings.push_back({dp::Point{-81.0, 37.0, 0.0}, dp::Point{-80.0, 37.0, 0.0}, dp::Point{-80.0, 38.0, 0.0},
                              dp::Point{-81.0, 37.0, 0.0}});
        fc.features.push_back(geoharvest::Feature{poly, {}});
        return fc;
    }
} // namespace

TEST_CASE("Writer - Write and read back") {
    auto fc = sampleCollection();
    const std::filesystem::path test_file = "/tmp/geoharvest_test_output.geojson";

    SUBCASE("Geometry and provenance survive a write") {
        geoharvest::write(fc, test_file);
        REQUIRE(std::filesystem::exists(test_file));

        auto back = geoharvest::read(test_file);
        CHECK(back.provenance.layer == "WV_wells");
        CHECK(back.provenance.source_crs == "EPSG:3857");
        CHECK(back.provenance.fetched_at == "2026-01-02T03:04:05Z");
        CHECK(back.provenance.complete);
        CHECK(back.provenance.drops.input == 4);
        CHECK(back.provenance.drops.decode_drops == 1);
        REQUIRE(back.features.size() == 3);

        auto *p = std::get_if<dp::Point>(&back.features[0].geometry);
        REQUIRE(p != nullptr);
        CHECK(p->x == doctest::Approx(-80.1));
        CHECK(p->y == doctest::Approx(38.2));
        CHECK(std::get<std::string>(back.features[0].properties.at("name")) == "well 17");
        CHECK(std::get<std::int64_t>(back.features[0].properties.at("api")) == 4700112345);
        CHECK(std::get<double>(back.features[0].properties.at("depth")) == doctest::Approx(1234.5));
        CHECK(std::get<bool>(back.features[0].properties.at("active")));
        CHECK(std::holds_alternative<std::nullptr_t>(back.features[0].properties.at("operator")));

        CHECK(std::holds_alternative<geoharvest::LineString>(back.features[1].geometry));
        auto *poly = std::get_if<geoharvest::Polygon>(&back.features[2].geometry);
        REQUIRE(poly != nullptr);
        CHECK(poly->rings[0].size() == 4);

        std::filesystem::remove(test_file);
    }

    SUBCASE("Coordinates are written lon, lat") {
        auto j = geoharvest::geometryToJson(fc.features[0].geometry);
        auto const &coords = j.as_object().at("coordinates").as_array();
        REQUIRE(coords.size() == 2);
        CHECK(coords[0].as_double() == doctest::Approx(-80.1));
        CHECK(coords[1].as_double() == doctest::Approx(38.2));
    }

    SUBCASE("Top-level properties carry the provenance") {
        auto j = geoharvest::toJson(fc);
        auto const &P = j.as_object().at("properties").as_object();
        CHECK(P.at("layer").as_string() == "WV_wells");
        CHECK(P.at("endpoint").as_string() == fc.provenance.endpoint);
        CHECK(P.at("complete").as_bool());
        CHECK(j.as_object().at("features").as_array().size() == 3);
    }

    SUBCASE("Rewriting replaces the previous file wholesale") {
        geoharvest::write(fc, test_file);
        fc.features.resize(1);
        geoharvest::write(fc, test_file);

        CHECK(geoharvest::read(test_file).features.size() == 1);
        CHECK_FALSE(std::filesystem::exists("/tmp/geoharvest_test_output.geojson.tmp"));
        std::filesystem::remove(test_file);
    }
}

TEST_CASE("Writer - Error handling") {
    auto fc = sampleCollection();

    SUBCASE("Missing directory") {
        const std::filesystem::path bad = "/tmp/geoharvest_no_such_dir/out.geojson";
        std::filesystem::remove_all("/tmp/geoharvest_no_such_dir");
        CHECK_THROWS_WITH(geoharvest::WriteFeatureCollection(fc, bad),
                          "Cannot open for write: /tmp/geoharvest_no_such_dir/out.geojson");
    }
}
