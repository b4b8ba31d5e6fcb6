/**
 * @file ArrayAssembler.cpp
 * @brief Implementation of the tile stitching
 */

#include "ArrayAssembler.hpp"
#include <algorithm>
#include <string>

namespace rasterdl {

ArrayAssembler::ArrayAssembler(const RasterSpec& raster, size_t tile_count)
    : raster_(raster),
      array_(RasterArray::Constant(raster.height, raster.width, kFillValue)),
      written_(tile_count, 0),
      rejected_(tile_count, 0),
      reject_reason_(tile_count),
      logger_("ArrayAssembler") {
}

bool ArrayAssembler::write(const TileResult& result) {
    if (!result.ok()) return false;

    const TileDescriptor& tile = result.tile;
    const size_t slot = static_cast<size_t>(tile.index);
    if (tile.index < 0 || slot >= written_.size()) {
        logger_.error("Tile index " + std::to_string(tile.index) + " outside grid of " +
                      std::to_string(written_.size()) + " tiles");
        return false;
    }
    if (written_[slot]) {
        return false;
    }

    const RasterArray& data = result.data();
    std::string reason;
    if (tile.row_start < 0 || tile.col_start < 0 || tile.rows() <= 0 || tile.cols() <= 0 ||
        tile.row_end > raster_.height || tile.col_end > raster_.width) {
        reason = tile.to_string() + " lies outside the " + std::to_string(raster_.height) + "x" +
                 std::to_string(raster_.width) + " raster";
    } else if (data.rows() != tile.rows() || data.cols() != tile.cols()) {
        reason = "tile data is " + std::to_string(data.rows()) + "x" + std::to_string(data.cols()) +
                 ", expected " + std::to_string(tile.rows()) + "x" + std::to_string(tile.cols());
    }

    if (!reason.empty()) {
        logger_.error("Rejecting " + tile.to_string() + ": " + reason);
        rejected_[slot] = 1;
        reject_reason_[slot] = reason;
        return false;
    }

    array_.block(tile.row_start, tile.col_start, tile.rows(), tile.cols()) = data;
    written_[slot] = 1;
    return true;
}

DownloadOutcome ArrayAssembler::finish(const std::vector<TileResult>& results) {
    DownloadOutcome outcome;
    outcome.tile_count = results.size();

    std::vector<const TileResult*> ordered;
    ordered.reserve(results.size());
    for (const auto& result : results) {
        ordered.push_back(&result);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TileResult* a, const TileResult* b) { return a->tile.index < b->tile.index; });

    for (const TileResult* result : ordered) {
        const size_t slot = static_cast<size_t>(result->tile.index);
        const bool known = result->tile.index >= 0 && slot < written_.size();

        if (result->ok()) {
            if (known && written_[slot]) continue;
            if (write(*result)) continue;

            FailedTile failed;
            failed.tile = result->tile;
            failed.kind = FailureKind::DECODE;
            failed.detail = (known && rejected_[slot]) ? reject_reason_[slot]
                                                      : "tile index outside grid";
            failed.attempts = result->attempts;
            outcome.failed_tiles.push_back(std::move(failed));
            continue;
        }

        FailedTile failed;
        failed.tile = result->tile;
        failed.kind = result->error().kind;
        failed.detail = result->error().detail;
        failed.attempts = result->attempts;
        outcome.failed_tiles.push_back(std::move(failed));
    }

    const size_t succeeded = static_cast<size_t>(std::count(written_.begin(), written_.end(), 1));
    if (outcome.failed_tiles.empty()) {
        logger_.detailed("Assembled " + std::to_string(succeeded) + " tiles into " +
                         std::to_string(raster_.height) + "x" + std::to_string(raster_.width) + " array");
    } else {
        logger_.warning("Assembled " + std::to_string(succeeded) + " of " +
                        std::to_string(results.size()) + " tiles; " +
                        std::to_string(outcome.failed_tiles.size()) + " regions left at fill value");
    }

    outcome.array = std::move(array_);
    array_ = RasterArray();
    return outcome;
}

DownloadOutcome assemble(const RasterSpec& raster, const std::vector<TileResult>& results) {
    size_t tile_count = 0;
    for (const auto& result : results) {
        if (result.tile.index >= 0) {
            tile_count = std::max(tile_count, static_cast<size_t>(result.tile.index) + 1);
        }
    }

    ArrayAssembler assembler(raster, tile_count);
    return assembler.finish(results);
}

} // namespace rasterdl
