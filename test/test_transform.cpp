#include <doctest/doctest.h>

#include "geoharvest/error.hpp"
#include "geoharvest/transform.hpp"
#include <limits>

using geoharvest::Transform;

TEST_CASE("Transform - CRS identifiers") {
    CHECK(geoharvest::canonicalCrs(" epsg:3857 ") == "EPSG:3857");
    CHECK(geoharvest::canonicalCrs("4326") == "EPSG:4326");
    CHECK(geoharvest::canonicalCrs("WGS84") == "EPSG:4326");
    CHECK(geoharvest::canonicalCrs("CRS:84") == "EPSG:4326");
    CHECK(geoharvest::canonicalCrs("ogc:crs84") == "EPSG:4326");
    CHECK(geoharvest::isWgs84("epsg:4326"));
    CHECK(geoharvest::isWgs84("urn:ogc:def:crs:OGC:1.3:CRS84"));
    CHECK_FALSE(geoharvest::isWgs84("EPSG:3857"));
}

TEST_CASE("Transform - Esri and OGC identifiers") {
    CHECK(geoharvest::canonicalCrs("ESRI:102100") == "EPSG:3857");
    CHECK(geoharvest::canonicalCrs("esri:102113") == "EPSG:3857");
    CHECK(geoharvest::canonicalCrs("EPSG:900913") == "EPSG:3857");
    CHECK(geoharvest::canonicalCrs("102100") == "EPSG:3857");
    CHECK(geoharvest::canonicalCrs("urn:ogc:def:crs:EPSG::3857") == "EPSG:3857");
    CHECK(geoharvest::canonicalCrs("urn:ogc:def:crs:EPSG:6.3:26917") == "EPSG:26917");
    CHECK(geoharvest::canonicalCrs("http://www.opengis.net/def/crs/EPSG/0/3857") == "EPSG:3857");

    // other Esri projections have no EPSG twin and stay as given
    CHECK(geoharvest::canonicalCrs("esri:102003") == "ESRI:102003");
}

TEST_CASE("Transform - WGS84 is the identity") {
    Transform t("EPSG:4326");
    CHECK(t.isIdentity());
    CHECK(t.source() == "EPSG:4326");

    dp::Point p{-80.25, 38.75, 0.0};
    auto once = t.forward(p);
    auto twice = t.forward(once);
    CHECK(once.x == p.x);
    CHECK(once.y == p.y);
    CHECK(twice.x == p.x);
    CHECK(twice.y == p.y);
}

TEST_CASE("Transform - Web Mercator") {
    Transform t("EPSG:3857");
    CHECK_FALSE(t.isIdentity());

    SUBCASE("Known point comes out lon, lat") {
        auto wgs = t.forward(dp::Point{-9203418.0, 4539833.0, 0.0});
        CHECK(wgs.x == doctest::Approx(-82.6757).epsilon(0.0001));
        CHECK(wgs.y == doctest::Approx(37.7192).epsilon(0.0001));
        CHECK(geoharvest::inWgs84Range(wgs));
    }

    SUBCASE("Origin") {
        auto wgs = t.forward(dp::Point{0.0, 0.0, 0.0});
        CHECK(wgs.x == doctest::Approx(0.0));
        CHECK(wgs.y == doctest::Approx(0.0));
    }

    SUBCASE("Forward then inverse returns the input") {
        dp::Point native{-8905559.26, 4865942.28, 0.0};
        auto back = t.inverse(t.forward(native));
        CHECK(back.x == doctest::Approx(native.x).epsilon(1e-9));
        CHECK(back.y == doctest::Approx(native.y).epsilon(1e-9));
    }

    SUBCASE("Non-finite input") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        CHECK_THROWS_AS(t.forward(dp::Point{nan, 0.0, 0.0}), geoharvest::HarvestError);
    }
}

TEST_CASE("Transform - Unknown CRS") {
    try {
        Transform t("EPSG:999999");
        FAIL("EPSG:999999 was accepted");
    } catch (const geoharvest::HarvestError &e) {
        CHECK(e.kind() == geoharvest::ErrorKind::ReprojectionError);
    }
    CHECK_THROWS_AS(Transform(""), geoharvest::HarvestError);
}

TEST_CASE("Transform - Range check") {
    CHECK(geoharvest::inWgs84Range(dp::Point{180.0, -90.0, 0.0}));
    CHECK_FALSE(geoharvest::inWgs84Range(dp::Point{38.0, -180.5, 0.0}));
    CHECK_FALSE(geoharvest::inWgs84Range(dp::Point{-9203418.0, 4539833.0, 0.0}));
}
