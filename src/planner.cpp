#include "geoharvest/planner.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace geoharvest {

    namespace {
        double edge(double min, double max, std::size_t divisions, std::size_t k) {
            if (k == divisions)
                return max;
            return min + (max - min) / static_cast<double>(divisions) * static_cast<double>(k);
        }
    } // namespace

    bool isValidBBox(const BBox &b) {
        if (!std::isfinite(b.xmin) || !std::isfinite(b.ymin) || !std::isfinite(b.xmax) || !std::isfinite(b.ymax))
            return false;
        if (b.xmin >= b.xmax || b.ymin >= b.ymax)
            return false;
        return b.xmin >= -180.0 && b.xmax <= 180.0 && b.ymin >= -90.0 && b.ymax <= 90.0;
    }

    std::vector<ChunkRequest> planChunks(const std::string &layer, const BBox &bbox, std::size_t rows,
                                         std::size_t cols) {
        if (rows == 0 || cols == 0)
            throw std::invalid_argument("planChunks(): grid divisions must be positive");
        if (!isValidBBox(bbox))
            throw std::invalid_argument("planChunks(): invalid bbox for layer '" + layer + "'");

        std::vector<ChunkRequest> plan;
        plan.reserve(rows * cols);
        for (std::size_t i = 0; i < cols; ++i) {
            double x0 = edge(bbox.xmin, bbox.xmax, cols, i);
            double x1 = edge(bbox.xmin, bbox.xmax, cols, i + 1);
            for (std::size_t j = 0; j < rows; ++j) {
                double y0 = edge(bbox.ymin, bbox.ymax, rows, j);
                double y1 = edge(bbox.ymin, bbox.ymax, rows, j + 1);

                ChunkRequest chunk;
                chunk.layer = layer;
                chunk.index = plan.size();
                chunk.target = GridCell{j, i, BBox{x0, y0, x1, y1}};
                plan.push_back(std::move(chunk));
            }
        }
        return plan;
    }

    ChunkRequest planPage(const std::string &layer, std::size_t index, std::size_t offset, std::size_t pageSize) {
        if (pageSize == 0)
            throw std::invalid_argument("planPage(): page size must be positive");
        ChunkRequest chunk;
        chunk.layer = layer;
        chunk.index = index;
        chunk.target = PageCursor{offset, pageSize};
        return chunk;
    }

    std::string describe(const ChunkRequest &chunk) {
        std::ostringstream oss;
        if (auto *cell = std::get_if<GridCell>(&chunk.target)) {
            oss << "(" << cell->col + 1 << "," << cell->row + 1 << ") [" << cell->envelope.xmin << ","
                << cell->envelope.ymin << "," << cell->envelope.xmax << "," << cell->envelope.ymax << "]";
        } else {
            auto const &page = std::get<PageCursor>(chunk.target);
            oss << "offset=" << page.offset << " size=" << page.size;
        }
        return oss.str();
    }

} // namespace geoharvest
