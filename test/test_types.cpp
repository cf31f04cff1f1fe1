#include <doctest/doctest.h>

#include "geoharvest/types.hpp"
#include <variant>

TEST_CASE("Types - Geometry variant") {
    SUBCASE("Point geometry") {
        geoharvest::Geometry geom = dp::Point{-80.0, 38.0, 0.0};
        CHECK(std::holds_alternative<dp::Point>(geom));
        auto *p = std::get_if<dp::Point>(&geom);
        REQUIRE(p != nullptr);
        CHECK(p->x == doctest::Approx(-80.0));
        CHECK(p->y == doctest::Approx(38.0));
    }

    SUBCASE("LineString geometry") {
        geoharvest::Geometry geom = geoharvest::LineString{dp::Point{0.0, 0.0, 0.0}, dp::Point{1.0, 1.0, 0.0}};
        CHECK(std::holds_alternative<geoharvest::LineString>(geom));
        CHECK(std::get<geoharvest::LineString>(geom).size() == 2);
    }

    SUBCASE("Polygon geometry") {
        geoharvest::Polygon poly;
        poly.rings.push_back({dp::Point{0.0, 0.0, 0.0}, dp::Point{1.0, 0.0, 0.0}, dp::Point{1.0, 1.0, 0.0},
                              dp::Point{0.0, 0.0, 0.0}});
        geoharvest::Geometry geom = poly;
        CHECK(std::holds_alternative<geoharvest::Polygon>(geom));
        CHECK(std::get<geoharvest::Polygon>(geom).rings.front().size() == 4);
    }
}

TEST_CASE("Types - BBox") {
    geoharvest::BBox b{-82.8, 37.0, -77.7, 40.6};
    CHECK(b.width() == doctest::Approx(5.1));
    CHECK(b.height() == doctest::Approx(3.6));
    CHECK(b.contains(-80.0, 38.0));
    CHECK(b.contains(-82.8, 37.0));
    CHECK_FALSE(b.contains(-83.0, 38.0));
}

TEST_CASE("Types - Timestamps are ISO-8601 UTC") {
    auto epoch = std::chrono::system_clock::time_point{};
    CHECK(geoharvest::isoTimestamp(epoch) == "1970-01-01T00:00:00Z");
    CHECK(geoharvest::isoTimestamp(epoch + std::chrono::seconds(86400 + 3661)) == "1970-01-02T01:01:01Z");
}
