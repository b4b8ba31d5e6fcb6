/**
 * @file ArrayAssembler.hpp
 * @brief Stitches decoded tiles into the full raster array
 */

#pragma once

#include "raster_downloader.hpp"
#include "Logger.hpp"
#include <vector>

namespace rasterdl {

/**
 * @brief Owner of the destination array during a download
 *
 * The array is allocated once, filled with kFillValue. write() may be called
 * from several threads at once as long as each call carries a different tile
 * of one grid: tiles of a grid never overlap, so the writes touch disjoint
 * cells and need no lock. finish() must only run after every writer is done.
 */
class ArrayAssembler {
public:
    /**
     * @param raster     Shape of the destination
     * @param tile_count Number of tiles of the grid being assembled
     */
    ArrayAssembler(const RasterSpec& raster, size_t tile_count);

    /**
     * @brief Copy a successful tile into place
     *
     * Failures are ignored here and collected by finish(). A tile whose data
     * does not match its descriptor, or that lies outside the raster, is not
     * written and is reported as a DECODE failure.
     *
     * @return true if the tile was written
     */
    bool write(const TileResult& result);

    /**
     * @brief Close the assembly and hand the array over
     *
     * Writes successful results not written yet, records every failure
     * ordered by tile index and moves the array into the outcome. The
     * assembler is empty afterwards.
     */
    DownloadOutcome finish(const std::vector<TileResult>& results);

    const RasterSpec& raster() const { return raster_; }

private:
    RasterSpec raster_;
    RasterArray array_;
    // Indexed by tile index; each entry is touched by the writer of that tile only
    std::vector<char> written_;
    std::vector<char> rejected_;
    std::vector<std::string> reject_reason_;
    Logger logger_;
};

/**
 * @brief Assemble a complete set of results in one call
 */
DownloadOutcome assemble(const RasterSpec& raster, const std::vector<TileResult>& results);

} // namespace rasterdl
