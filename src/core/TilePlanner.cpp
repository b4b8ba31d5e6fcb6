/**
 * @file TilePlanner.cpp
 * @brief Implementation of the tile grid planner
 */

#include "TilePlanner.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace rasterdl {

namespace {

// floor(sqrt(n)) without floating point drift for large n
std::int64_t integer_sqrt(std::int64_t n) {
    auto root = static_cast<std::int64_t>(std::sqrt(static_cast<double>(n)));
    while (root > 0 && root * root > n) --root;
    while ((root + 1) * (root + 1) <= n) ++root;
    return root;
}

std::int64_t ceil_div(std::int64_t a, std::int64_t b) {
    return (a + b - 1) / b;
}

} // namespace

TilePlanner::TilePlanner() : logger_("TilePlanner") {
}

TileGrid TilePlanner::plan(const RasterSpec& raster, std::int64_t max_bytes) const {
    if (raster.height <= 0 || raster.width <= 0) {
        throw ConfigurationError("raster has no pixels (" + std::to_string(raster.height) +
                                 "x" + std::to_string(raster.width) + ")");
    }
    if (raster.pixel_bytes <= 0) {
        throw ConfigurationError("pixel size must be positive, got " + std::to_string(raster.pixel_bytes));
    }
    if (max_bytes < raster.pixel_bytes) {
        throw ConfigurationError("ceiling of " + std::to_string(max_bytes) +
                                 " bytes cannot hold one " + std::to_string(raster.pixel_bytes) +
                                 "-byte pixel");
    }

    const std::int64_t row_bytes = raster.width * raster.pixel_bytes;
    std::int64_t tile_rows = 0;
    std::int64_t tile_cols = 0;

    if (raster.total_bytes() <= max_bytes) {
        tile_rows = raster.height;
        tile_cols = raster.width;
    } else if (row_bytes <= max_bytes) {
        tile_cols = raster.width;
        tile_rows = max_bytes / row_bytes;
    } else {
        const std::int64_t max_pixels = max_bytes / raster.pixel_bytes;
        tile_rows = std::min(integer_sqrt(max_pixels), raster.height);
        tile_cols = std::min(max_pixels / tile_rows, raster.width);
    }

    const std::int64_t row_strips = ceil_div(raster.height, tile_rows);
    const std::int64_t col_strips = ceil_div(raster.width, tile_cols);
    if (row_strips > kMaxTiles / col_strips) {
        throw ConfigurationError("ceiling of " + std::to_string(max_bytes) + " bytes splits a " +
                                 std::to_string(raster.height) + "x" + std::to_string(raster.width) +
                                 " raster into more than " + std::to_string(kMaxTiles) + " tiles");
    }

    TileGrid grid;
    grid.raster = raster;
    grid.max_bytes = max_bytes;
    grid.tile_rows = tile_rows;
    grid.tile_cols = tile_cols;

    grid.tiles.reserve(static_cast<size_t>(row_strips * col_strips));

    int index = 0;
    for (std::int64_t r = 0; r < row_strips; ++r) {
        const std::int64_t row_start = r * tile_rows;
        const std::int64_t row_end = (r == row_strips - 1) ? raster.height : row_start + tile_rows;

        for (std::int64_t c = 0; c < col_strips; ++c) {
            const std::int64_t col_start = c * tile_cols;
            const std::int64_t col_end = (c == col_strips - 1) ? raster.width : col_start + tile_cols;
            grid.tiles.emplace_back(index++, row_start, row_end, col_start, col_end);
        }
    }

    logger_.detailed("Planned " + std::to_string(grid.tiles.size()) + " tiles of nominal size " +
                     std::to_string(tile_rows) + "x" + std::to_string(tile_cols) +
                     " for a " + std::to_string(raster.height) + "x" + std::to_string(raster.width) +
                     " raster (ceiling " + std::to_string(max_bytes) + " bytes)");

    return grid;
}

bool is_exact_partition(const TileGrid& grid) {
    const auto& raster = grid.raster;
    if (raster.height <= 0 || raster.width <= 0) return false;

    std::int64_t covered = 0;
    for (const auto& tile : grid.tiles) {
        if (tile.row_start < 0 || tile.col_start < 0 ||
            tile.row_end > raster.height || tile.col_end > raster.width ||
            tile.rows() <= 0 || tile.cols() <= 0) {
            return false;
        }
        covered += tile.pixel_count();
    }
    if (covered != raster.pixel_count()) return false;

    // Equal area plus pairwise disjointness implies full coverage
    for (size_t i = 0; i < grid.tiles.size(); ++i) {
        const auto& a = grid.tiles[i];
        for (size_t j = i + 1; j < grid.tiles.size(); ++j) {
            const auto& b = grid.tiles[j];
            const bool rows_overlap = a.row_start < b.row_end && b.row_start < a.row_end;
            const bool cols_overlap = a.col_start < b.col_end && b.col_start < a.col_end;
            if (rows_overlap && cols_overlap) return false;
        }
    }
    return true;
}

RasterArray tile_index_map(const TileGrid& grid) {
    RasterArray map = RasterArray::Constant(grid.raster.height, grid.raster.width, -1.0);
    for (const auto& tile : grid.tiles) {
        map.block(tile.row_start, tile.col_start, tile.rows(), tile.cols()).setConstant(tile.index);
    }
    return map;
}

TileBounds tile_bounds(const GeoTransform& geo, const TileDescriptor& tile) {
    auto top_left = geo.apply(static_cast<double>(tile.col_start), static_cast<double>(tile.row_start));
    auto bottom_right = geo.apply(static_cast<double>(tile.col_end), static_cast<double>(tile.row_end));

    TileBounds bounds;
    bounds.top_left_x = top_left.first;
    bounds.top_left_y = top_left.second;
    bounds.bottom_right_x = bottom_right.first;
    bounds.bottom_right_y = bottom_right.second;
    return bounds;
}

} // namespace rasterdl
