/**
 * @file TileDecoder.hpp
 * @brief Decodes tile payloads into sample arrays using GDAL
 */

#pragma once

#include "raster_downloader.hpp"
#include "Logger.hpp"
#include <vector>
#include <cstdint>

namespace rasterdl {

/**
 * @brief GDAL-backed payload decoder
 *
 * Accepts a GeoTIFF, or a zip archive whose first raster entry is one, held
 * entirely in memory. Band 1 must be stored with the band's native sample
 * type and is read as double. Safe to use from several
 * threads at once.
 */
class TileDecoder {
public:
    TileDecoder();

    /**
     * @brief Decode a payload and check its shape and sample type
     *
     * @param payload Encoded bytes as returned by the service
     * @param rows    Expected raster height
     * @param cols    Expected raster width
     * @param type    Expected sample type of the band
     * @throws DecodeError if the payload is unreadable or its shape or
     *         sample type differs
     */
    RasterArray decode(const std::vector<std::uint8_t>& payload,
                       std::int64_t rows, std::int64_t cols, DataType type) const;

    /// True if the payload starts with a zip local file header
    static bool is_zip(const std::vector<std::uint8_t>& payload);

private:
    Logger logger_;
};

} // namespace rasterdl
