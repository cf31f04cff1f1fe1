#pragma once

#include "geoharvest/log.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace geoharvest {

    struct TileJob {
        std::filesystem::path geojson;
        std::string layer;
        int minZoom = 4;
        int maxZoom = 14;
    };

    class TileBuilder {
      public:
        virtual ~TileBuilder() = default;

        // false when the tile set could not be built; never throws for a failed build
        virtual bool build(const TileJob &job) = 0;
    };

    // Runs tippecanoe (or a compatible program) once per job, writing <tilesDir>/<layer>/
    class CommandTileBuilder : public TileBuilder {
      private:
        std::string program_;
        std::filesystem::path tilesDir_;
        Logger log_;

      public:
        CommandTileBuilder(std::filesystem::path tilesDir, Logger log, std::string program = "tippecanoe");

        std::vector<std::string> command(const TileJob &job) const;

        bool build(const TileJob &job) override;
    };

    // Builds every job in order and returns the layers that produced tiles
    std::vector<std::string> buildTiles(TileBuilder &builder, const std::vector<TileJob> &jobs);

} // namespace geoharvest
