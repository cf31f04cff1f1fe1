#include <doctest/doctest.h>

#include "geoharvest/tiles.hpp"
#include <filesystem>
#include <fstream>

namespace {
    class RecordingBuilder : public geoharvest::TileBuilder {
      public:
        std::vector<std::string> seen;

        bool build(const geoharvest::TileJob &job) override {
            seen.push_back(job.layer);
            return job.layer != "broken";
        }
    };
} // namespace

TEST_CASE("Tiles - tippecanoe command line") {
    geoharvest::CommandTileBuilder builder("tiles", nullptr);
    geoharvest::TileJob job{"geojson/WV_wells.geojson", "WV_wells", 4, 14};

    auto cmd = builder.command(job);
    REQUIRE(cmd.size() == 9);
    CHECK(cmd[0] == "tippecanoe");
    CHECK(cmd[1] == "--output-to-directory");
    CHECK(cmd[2] == "tiles/WV_wells");
    CHECK(cmd[3] == "--layer");
    CHECK(cmd[4] == "WV_wells");
    CHECK(cmd[5] == "--force");
    CHECK(cmd[6] == "--minimum-zoom=4");
    CHECK(cmd[7] == "--maximum-zoom=14");
    CHECK(cmd[8] == "geojson/WV_wells.geojson");
}

TEST_CASE("Tiles - Running the builder") {
    const std::filesystem::path root = "/tmp/geoharvest_tiles";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
    const auto input = root / "layer.geojson";
    std::ofstream(input) << R"({"type":"FeatureCollection","features":[]})";

    SUBCASE("Missing input is skipped") {
        geoharvest::CommandTileBuilder builder(root / "tiles", nullptr, "true");
        CHECK_FALSE(builder.build(geoharvest::TileJob{root / "missing.geojson", "missing", 4, 14}));
    }

    SUBCASE("Exit status decides success") {
        geoharvest::CommandTileBuilder ok(root / "tiles", nullptr, "true");
        CHECK(ok.build(geoharvest::TileJob{input, "layer", 4, 14}));
        CHECK(std::filesystem::is_directory(root / "tiles" / "layer"));

        geoharvest::CommandTileBuilder failing(root / "tiles", nullptr, "false");
        CHECK_FALSE(failing.build(geoharvest::TileJob{input, "layer", 4, 14}));
    }

    SUBCASE("Program not found") {
        geoharvest::CommandTileBuilder builder(root / "tiles", nullptr, "geoharvest-no-such-program");
        CHECK_FALSE(builder.build(geoharvest::TileJob{input, "layer", 4, 14}));
    }

    std::filesystem::remove_all(root);
}

TEST_CASE("Tiles - Every job is attempted") {
    RecordingBuilder builder;
    std::vector<geoharvest::TileJob> jobs{{"a.geojson", "a", 4, 14}, {"b.geojson", "broken", 4, 14},
                                          {"c.geojson", "c", 4, 14}};

    auto built = geoharvest::buildTiles(builder, jobs);
    CHECK(builder.seen.size() == 3);
    REQUIRE(built.size() == 2);
    CHECK(built[0] == "a");
    CHECK(built[1] == "c");
}
