#pragma once

#include "assembler.hpp"
#include "config.hpp"
#include "crs.hpp"
#include "error.hpp"
#include "fetcher.hpp"
#include "harvester.hpp"
#include "log.hpp"
#include "normalizer.hpp"
#include "parser.hpp"
#include "planner.hpp"
#include "tiles.hpp"
#include "transform.hpp"
#include "transport.hpp"
#include "types.hpp"
#include "writer.hpp"

namespace geoharvest {

    FeatureCollection read(const std::filesystem::path &file);

    void write(const FeatureCollection &fc, const std::filesystem::path &outPath);

} // namespace geoharvest
