#include <doctest/doctest.h>

#include "fake_transport.hpp"
#include "geoharvest/crs.hpp"
#include "geoharvest/error.hpp"
#include <memory>

using geoharvest::CrsResolver;
using geoharvest::CrsSource;
using geoharvest::LayerDescriptor;

namespace {
    const std::string kQuery = "https://example.test/arcgis/rest/services/wells/MapServer/0/query";
    const std::string kMeta = "https://example.test/arcgis/rest/services/wells/MapServer/0";

    LayerDescriptor layer(std::optional<std::string> crs = std::nullopt) {
        return LayerDescriptor{"WV_wells", kQuery, std::nullopt, crs, "fallback_data/WV_wells.geojson"};
    }
} // namespace

TEST_CASE("CRS - wkid mapping") {
    CHECK(*geoharvest::wkidToEpsg(102100) == "EPSG:3857");
    CHECK(*geoharvest::wkidToEpsg(102113) == "EPSG:3857");
    CHECK(*geoharvest::wkidToEpsg(900913) == "EPSG:3857");
    CHECK(*geoharvest::wkidToEpsg(4326) == "EPSG:4326");
    CHECK(*geoharvest::wkidToEpsg(26917) == "EPSG:26917");
    CHECK_FALSE(geoharvest::wkidToEpsg(0).has_value());

    CHECK(*geoharvest::epsgNumber("EPSG:3857") == 3857);
    CHECK(*geoharvest::epsgNumber("epsg:26917") == 26917);
    CHECK(*geoharvest::epsgNumber("ESRI:102100") == 3857);
    CHECK(*geoharvest::epsgNumber("urn:ogc:def:crs:EPSG::26917") == 26917);
    CHECK_FALSE(geoharvest::epsgNumber("ESRI:102003").has_value());
    CHECK_FALSE(geoharvest::epsgNumber("EPSG:abc").has_value());
}

TEST_CASE("CRS - Metadata endpoint") {
    CHECK(geoharvest::metadataUrl(kQuery) == kMeta);
    CHECK(geoharvest::metadataUrl(kQuery + "/") == kMeta);
    CHECK(geoharvest::metadataUrl(kQuery + "?where=1%3D1") == kMeta);
    CHECK(geoharvest::metadataUrl(kMeta) == kMeta);
}

TEST_CASE("CRS - Parsing spatialReference") {
    SUBCASE("Extent first, latestWkid preferred") {
        auto code = geoharvest::parseSpatialReference(
            R"({"extent":{"xmin":0,"spatialReference":{"wkid":102100,"latestWkid":3857}},
                "spatialReference":{"wkid":4326}})");
        CHECK(code == "EPSG:3857");
    }

    SUBCASE("Top-level spatialReference") {
        CHECK(geoharvest::parseSpatialReference(R"({"spatialReference":{"wkid":102100}})") == "EPSG:3857");
        CHECK(geoharvest::parseSpatialReference(R"({"spatialReference":{"wkid":4269}})") == "EPSG:4269");
    }

    SUBCASE("Nothing usable") {
        CHECK_THROWS_AS(geoharvest::parseSpatialReference("{}"), geoharvest::HarvestError);
        CHECK_THROWS_AS(geoharvest::parseSpatialReference("<html>"), geoharvest::HarvestError);
        CHECK_THROWS_AS(geoharvest::parseSpatialReference(R"({"spatialReference":{"wkt":"PROJCS[...]"}})"),
                        geoharvest::HarvestError);
    }
}

TEST_CASE("CRS - Resolution priority") {
    auto transport = std::make_shared<FakeTransport>([](const std::string &url, const geoharvest::QueryParams &p) {
        if (url == kMeta && param(p, "f") == "json")
            return okBody(R"({"extent":{"spatialReference":{"wkid":102100,"latestWkid":3857}}})");
        return httpStatus(404);
    });
    CrsResolver resolver(transport, "EPSG:4326", std::chrono::seconds(1), nullptr);

    SUBCASE("Declared CRS wins without a probe") {
        auto crs = resolver.resolve(layer(std::string("epsg:26917")));
        CHECK(crs.code == "EPSG:26917");
        CHECK(crs.source == CrsSource::Declared);
        CHECK(transport->calls() == 0);
    }

    SUBCASE("Probe when nothing is declared") {
        auto crs = resolver.resolve(layer());
        CHECK(crs.code == "EPSG:3857");
        CHECK(crs.source == CrsSource::Probed);
        CHECK(transport->callsTo(kMeta) == 1);
    }
}

TEST_CASE("CRS - Failed probe falls back to the default") {
    SUBCASE("Network failure") {
        auto transport = std::make_shared<FakeTransport>(
            [](const std::string &, const geoharvest::QueryParams &) { return timeout(); });
        CrsResolver resolver(transport, "EPSG:4326", std::chrono::seconds(1), nullptr);

        auto crs = resolver.resolve(layer());
        CHECK(crs.code == "EPSG:4326");
        CHECK(crs.source == CrsSource::Default);
        CHECK_THROWS_AS(resolver.probe(layer()), geoharvest::HarvestError);
    }

    SUBCASE("Metadata without a spatial reference") {
        auto transport = std::make_shared<FakeTransport>(
            [](const std::string &, const geoharvest::QueryParams &) { return okBody(R"({"name":"wells"})"); });
        CrsResolver resolver(transport, "wgs84", std::chrono::seconds(1), nullptr);

        auto crs = resolver.resolve(layer());
        CHECK(crs.code == "EPSG:4326");
        CHECK(crs.source == CrsSource::Default);
        CHECK(resolver.defaultCrs() == "EPSG:4326");
    }
}
