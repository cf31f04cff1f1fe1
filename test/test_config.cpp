#include <doctest/doctest.h>

#include "geoharvest/config.hpp"
#include "geoharvest/crs.hpp"
#include "geoharvest/error.hpp"
#include <filesystem>
#include <fstream>

using geoharvest::ErrorKind;
using geoharvest::HarvestError;

namespace {
    ErrorKind kindOf(const std::string &text) {
        try {
            geoharvest::parseConfig(text);
        } catch (const HarvestError &e) {
            return e.kind();
        }
        FAIL("config was accepted: " << text);
        return ErrorKind::OutputError;
    }
} // namespace

TEST_CASE("Config - Defaults") {
    auto cfg = geoharvest::parseConfig("{}");

    CHECK(cfg.output_dir == "geojson");
    CHECK(cfg.tiles_dir == "tiles");
    CHECK(cfg.fallback_dir == "fallback_data");
    CHECK(cfg.log_file == "harvest.log");
    CHECK(cfg.grid_rows == 5);
    CHECK(cfg.grid_cols == 5);
    CHECK(cfg.layer_budget == std::chrono::seconds(300));
    CHECK(cfg.request_timeout == std::chrono::seconds(45));
    CHECK(cfg.retries == 1);
    CHECK(cfg.retry_backoff == std::chrono::milliseconds(2000));
    CHECK(cfg.page_size == 1000);
    CHECK(cfg.chunk_workers == 4);
    CHECK(cfg.layer_workers == 1);
    CHECK(cfg.max_page_failures == 3);
    CHECK(cfg.default_crs == "EPSG:4326");
    CHECK_FALSE(cfg.axis_swap);
    CHECK(cfg.min_zoom == 4);
    CHECK(cfg.max_zoom == 14);

    SUBCASE("Built-in catalog") {
        REQUIRE(cfg.layers.size() == 3);
        CHECK(cfg.layers[0].name == "WV_wells");
        CHECK(cfg.layers[1].name == "OH_parcels");
        CHECK(cfg.layers[2].name == "TX_parcels");
        REQUIRE(cfg.layers[0].bbox.has_value());
        CHECK(cfg.layers[0].bbox->xmin == doctest::Approx(-82.8));
        CHECK(cfg.layers[0].bbox->ymax == doctest::Approx(40.6));
        CHECK(cfg.layers[0].fallback == std::filesystem::path("fallback_data") / "WV_wells.geojson");
        CHECK_FALSE(cfg.layers[0].crs.has_value());
    }
}

TEST_CASE("Config - Overrides and layers") {
    auto cfg = geoharvest::parseConfig(R"({
        "output_dir": "/tmp/out",
        "fallback_dir": "/tmp/fb",
        "grid": [2, 3],
        "layer_budget_seconds": 1.5,
        "retries": 2,
        "retry_backoff_ms": 10,
        "axis_swap": true,
        "max_zoom": 16,
        "layers": [
            {"name": "A", "url": "https://a.test/MapServer/0/query", "bbox": [-1, -1, 1, 1], "crs": "EPSG:3857"},
            {"name": "B", "url": "https://b.test/MapServer/0/query", "fallback": "/data/b.geojson"}
        ]
    })");

    CHECK(cfg.output_dir == "/tmp/out");
    CHECK(cfg.grid_rows == 2);
    CHECK(cfg.grid_cols == 3);
    CHECK(cfg.layer_budget == std::chrono::milliseconds(1500));
    CHECK(cfg.retries == 2);
    CHECK(cfg.retry_backoff == std::chrono::milliseconds(10));
    CHECK(cfg.axis_swap);
    CHECK(cfg.max_zoom == 16);

    REQUIRE(cfg.layers.size() == 2);
    CHECK(*cfg.layers[0].crs == "EPSG:3857");
    CHECK(cfg.layers[0].fallback == std::filesystem::path("/tmp/fb/A.geojson"));
    CHECK_FALSE(cfg.layers[1].bbox.has_value());
    CHECK(cfg.layers[1].fallback == std::filesystem::path("/data/b.geojson"));

    SUBCASE("Moving the fallback directory") {
        geoharvest::setFallbackDir(cfg, "/srv/fallback");
        CHECK(cfg.fallback_dir == "/srv/fallback");
        CHECK(cfg.layers[0].fallback == std::filesystem::path("/srv/fallback/A.geojson"));
        CHECK(cfg.layers[1].fallback == std::filesystem::path("/data/b.geojson"));
    }
}

TEST_CASE("Config - Rejected input") {
    CHECK(kindOf("not json") == ErrorKind::ConfigError);
    CHECK(kindOf("[]") == ErrorKind::ConfigError);
    CHECK(kindOf(R"({"retries": "two"})") == ErrorKind::ConfigError);
    CHECK(kindOf(R"({"grid": [0, 5]})") == ErrorKind::ConfigError);
    CHECK(kindOf(R"({"min_zoom": 10, "max_zoom": 5})") == ErrorKind::ConfigError);
    CHECK(kindOf(R"({"layers": [{"name": "A"}]})") == ErrorKind::ConfigError);
    CHECK(kindOf(R"({"layers": [{"url": "u"}]})") == ErrorKind::ConfigError);
    CHECK(kindOf(R"({"layers": [{"name": "A", "url": "u"}, {"name": "A", "url": "v"}]})") ==
          ErrorKind::ConfigError);
    CHECK(kindOf(R"({"layers": [{"name": "A", "url": "u", "bbox": [1, 0, 0, 1]}]})") == ErrorKind::ConfigError);
    CHECK(kindOf(R"({"layers": [{"name": "A", "url": "u", "bbox": [0, 0, 1]}]})") == ErrorKind::ConfigError);
}

TEST_CASE("Config - Declared CRS must carry an EPSG code") {
    SUBCASE("Esri Web Mercator and OGC URN are read as EPSG:3857") {
        auto cfg = geoharvest::parseConfig(R"({"layers": [
            {"name": "A", "url": "u", "crs": "ESRI:102100"},
            {"name": "B", "url": "v", "crs": "urn:ogc:def:crs:EPSG::3857"}]})");
        REQUIRE(cfg.layers.size() == 2);
        CHECK(geoharvest::epsgNumber(*cfg.layers[0].crs) == 3857);
        CHECK(geoharvest::epsgNumber(*cfg.layers[1].crs) == 3857);
    }

    SUBCASE("Anything else is rejected") {
        CHECK(kindOf(R"({"layers": [{"name": "A", "url": "u", "crs": "ESRI:102003"}]})") == ErrorKind::ConfigError);
        CHECK(kindOf(R"({"layers": [{"name": "A", "url": "u", "crs": "NAD83 / UTM 17N"}]})") ==
              ErrorKind::ConfigError);
        CHECK(kindOf(R"({"default_crs": "ESRI:54030"})") == ErrorKind::ConfigError);
    }
}

TEST_CASE("Config - Reading a file") {
    const std::filesystem::path file = "/tmp/geoharvest_test_config.json";
    std::ofstream ofs(file);
    ofs << R"({"page_size": 250, "layers": [{"name": "A", "url": "https://a.test/query"}]})";
    ofs.close();

    auto cfg = geoharvest::readConfig(file);
    CHECK(cfg.page_size == 250);
    REQUIRE(cfg.layers.size() == 1);
    CHECK(cfg.layers[0].name == "A");
    std::filesystem::remove(file);

    CHECK_THROWS_AS(geoharvest::readConfig("/tmp/geoharvest_missing_config.json"), HarvestError);
}
