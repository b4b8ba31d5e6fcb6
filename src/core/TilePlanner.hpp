/**
 * @file TilePlanner.hpp
 * @brief Partitions a raster into tiles that each fit a payload ceiling
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "raster_downloader.hpp"
#include "Logger.hpp"
#include <cstdint>

namespace rasterdl {

/**
 * @brief Ground-coordinate corners of a tile
 */
struct TileBounds {
    double top_left_x = 0.0, top_left_y = 0.0;
    double bottom_right_x = 0.0, bottom_right_y = 0.0;
};

/**
 * @brief Tile grid planner
 *
 * Tiles are full-width row strips whenever one row of the raster fits the
 * ceiling, near-square blocks otherwise. Every strip but the last has the
 * nominal size; the last one in each dimension takes the remainder. The
 * result depends only on the inputs.
 */
class TilePlanner {
public:
    /// Largest number of tiles a single plan may hold
    static constexpr std::int64_t kMaxTiles = 1000000;

    TilePlanner();

    /**
     * @brief Plan the tiles of a raster
     *
     * @param raster    Raster dimensions and sample size
     * @param max_bytes Largest uncompressed payload of one tile
     * @return Tiles in row-major order, indexed from 0
     * @throws ConfigurationError if max_bytes cannot hold a single pixel,
     *         the raster has no pixels or the plan would exceed kMaxTiles
     */
    TileGrid plan(const RasterSpec& raster, std::int64_t max_bytes) const;

private:
    Logger logger_;
};

/**
 * @brief Check the partition invariant of a grid
 *
 * @return true if the tiles lie inside the raster, are pairwise disjoint and
 *         cover every pixel
 */
bool is_exact_partition(const TileGrid& grid);

/**
 * @brief Raster-shaped map holding, per pixel, the index of its tile
 *
 * Handy to inspect a tiling visually.
 */
RasterArray tile_index_map(const TileGrid& grid);

/**
 * @brief Corners of a tile in the raster's ground coordinates
 */
TileBounds tile_bounds(const GeoTransform& geo, const TileDescriptor& tile);

} // namespace rasterdl
