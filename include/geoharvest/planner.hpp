#pragma once

#include "geoharvest/types.hpp"

#include <string>
#include <vector>

namespace geoharvest {

    // Finite, min < max on both axes, inside [-180,180] x [-90,90]
    bool isValidBBox(const BBox &bbox);

    // Splits bbox into rows x cols envelopes, column-major (x outer, y inner).
    // Cell edges come from (max - min) / divisions; adjacent cells share bit-identical edges and
    // the last edge on each axis is pinned to the bbox max. Throws std::invalid_argument.
    std::vector<ChunkRequest> planChunks(const std::string &layer, const BBox &bbox, std::size_t rows,
                                         std::size_t cols);

    ChunkRequest planPage(const std::string &layer, std::size_t index, std::size_t offset, std::size_t pageSize);

    // "(i,j)" for grid cells (1-based col,row), "offset=N" for pages
    std::string describe(const ChunkRequest &chunk);

} // namespace geoharvest
