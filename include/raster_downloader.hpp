#pragma once

/**
 * @file raster_downloader.hpp
 * @brief Main header for the tiled raster band downloader
 *
 * Retrieves one band of a large raster from an image-serving API that caps
 * the payload of each request. The raster is split into a grid of tiles,
 * the tiles are fetched in parallel and stitched back into one array.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <memory>
#include <vector>
#include <string>
#include <array>
#include <utility>
#include <optional>
#include <variant>
#include <functional>
#include <chrono>
#include <cstdint>
#include <cstddef>

// Linear algebra
#include <Eigen/Dense>

#include "DownloadErrors.hpp"

namespace rasterdl {

class ImageryClient;
class CancellationToken;

// ============================================================================
// Pixel data
// ============================================================================

/**
 * @brief Row-major 2-D array of samples
 *
 * Every supported sample type up to 32 bits converts to double exactly, so
 * a tiled download stays pixel-identical to a single read.
 */
using RasterArray = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Value of cells whose tile was never fetched
constexpr double kFillValue = 0.0;

/**
 * @brief Native sample type of a raster band
 */
enum class DataType {
    UINT8,
    INT8,
    UINT16,
    INT16,
    UINT32,
    INT32,
    FLOAT32,
    FLOAT64
};

/// Bytes per sample for a data type
int pixel_bytes(DataType type);

/// Lower-case name ("uint16", "float32", ...)
const char* data_type_name(DataType type);

/**
 * @brief Narrowest integer type holding [min_value, max_value]
 *
 * Mirrors how an integer band advertises its range instead of a width.
 */
DataType integer_type_for_range(double min_value, double max_value);

/**
 * @brief Affine pixel-to-ground transform of a raster, GDAL coefficient order
 *
 * x = c[0] + col * c[1] + row * c[2]
 * y = c[3] + col * c[4] + row * c[5]
 */
struct GeoTransform {
    std::array<double, 6> coefficients{0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    std::string crs;  // e.g. "EPSG:32633"

    std::pair<double, double> apply(double col, double row) const {
        return {coefficients[0] + col * coefficients[1] + row * coefficients[2],
                coefficients[3] + col * coefficients[4] + row * coefficients[5]};
    }

    /// Transform of the same grid with its origin moved to (row, col)
    GeoTransform shifted_to(std::int64_t row, std::int64_t col) const;
};

/**
 * @brief Dimensions and sample layout of one raster band
 *
 * Supplied by the upstream service; height * width * pixel_bytes is the
 * uncompressed size of the full band.
 */
struct RasterSpec {
    std::int64_t height = 0;
    std::int64_t width = 0;
    int pixel_bytes = 0;
    DataType data_type = DataType::FLOAT64;
    std::optional<GeoTransform> geo;

    RasterSpec() = default;
    RasterSpec(std::int64_t h, std::int64_t w, int bytes)
        : height(h), width(w), pixel_bytes(bytes) {}
    RasterSpec(std::int64_t h, std::int64_t w, DataType type)
        : height(h), width(w), pixel_bytes(rasterdl::pixel_bytes(type)), data_type(type) {}

    std::int64_t pixel_count() const { return height * width; }
    std::int64_t total_bytes() const { return pixel_count() * pixel_bytes; }
};

// ============================================================================
// Tiling
// ============================================================================

/**
 * @brief Half-open pixel window of a raster
 */
struct PixelWindow {
    std::int64_t row_start = 0, row_end = 0;
    std::int64_t col_start = 0, col_end = 0;

    std::int64_t rows() const { return row_end - row_start; }
    std::int64_t cols() const { return col_end - col_start; }
};

/**
 * @brief One tile of a grid, fetched as one independent request
 */
struct TileDescriptor {
    int index = 0;  // position in the grid, row-major
    std::int64_t row_start = 0, row_end = 0;
    std::int64_t col_start = 0, col_end = 0;

    TileDescriptor() = default;
    TileDescriptor(int idx, std::int64_t r0, std::int64_t r1, std::int64_t c0, std::int64_t c1)
        : index(idx), row_start(r0), row_end(r1), col_start(c0), col_end(c1) {}

    std::int64_t rows() const { return row_end - row_start; }
    std::int64_t cols() const { return col_end - col_start; }
    std::int64_t pixel_count() const { return rows() * cols(); }
    std::int64_t byte_size(int pixel_bytes) const { return pixel_count() * pixel_bytes; }

    PixelWindow window() const { return {row_start, row_end, col_start, col_end}; }

    /// "Tile[r0:r1,c0:c1]"
    std::string to_string() const;

    bool operator==(const TileDescriptor& other) const {
        return index == other.index &&
               row_start == other.row_start && row_end == other.row_end &&
               col_start == other.col_start && col_end == other.col_end;
    }
    bool operator!=(const TileDescriptor& other) const { return !(*this == other); }
};

/**
 * @brief Ordered tiles that cover a raster exactly once
 */
struct TileGrid {
    RasterSpec raster;
    std::int64_t max_bytes = 0;
    std::int64_t tile_rows = 0;   // nominal tile height
    std::int64_t tile_cols = 0;   // nominal tile width
    std::vector<TileDescriptor> tiles;

    size_t size() const { return tiles.size(); }
    bool empty() const { return tiles.empty(); }
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Why a tile did not produce data
 */
enum class FailureKind {
    TRANSIENT,  ///< Timeout, rate limit or server hiccup; retried
    PERMANENT,  ///< Malformed request, authorization, oversize payload
    DECODE,     ///< Payload does not parse into the expected shape or sample type
    CANCELLED   ///< Caller aborted the download
};

const char* failure_kind_name(FailureKind kind);

struct TileFailure {
    FailureKind kind = FailureKind::PERMANENT;
    std::string detail;
};

/**
 * @brief Terminal (or intermediate) outcome of fetching one tile
 */
struct TileResult {
    TileDescriptor tile;
    int attempts = 0;
    std::variant<RasterArray, TileFailure> payload;

    static TileResult success(const TileDescriptor& tile, RasterArray data, int attempts = 1);
    static TileResult failure(const TileDescriptor& tile, FailureKind kind,
                              const std::string& detail, int attempts = 1);

    bool ok() const { return std::holds_alternative<RasterArray>(payload); }
    const RasterArray& data() const { return std::get<RasterArray>(payload); }
    RasterArray& data() { return std::get<RasterArray>(payload); }
    const TileFailure& error() const { return std::get<TileFailure>(payload); }
};

/**
 * @brief A tile that ended in failure, as reported to the caller
 */
struct FailedTile {
    TileDescriptor tile;
    FailureKind kind = FailureKind::PERMANENT;
    std::string detail;
    int attempts = 0;
};

/**
 * @brief Terminal artifact of one download
 *
 * The array is returned even when some tiles failed; their regions hold
 * kFillValue and the tiles are listed in failed_tiles.
 */
struct DownloadOutcome {
    std::optional<RasterArray> array;
    std::vector<FailedTile> failed_tiles;
    size_t tile_count = 0;

    bool complete() const { return array.has_value() && failed_tiles.empty(); }
};

// ============================================================================
// Configuration
// ============================================================================

/// Invoked once per tile reaching a terminal state
using ProgressCallback = std::function<void(size_t done, size_t total)>;

/**
 * @brief Tunables of one download, passed explicitly to the downloader
 */
struct DownloadConfig {
    /// Largest uncompressed payload of one request
    std::int64_t max_bytes = 33554432;
    /// Simultaneous tile requests
    int concurrency = 5;
    /// Extra attempts for a tile that failed transiently
    int max_retries = 5;
    /// Bounded wait of one tile request
    std::chrono::milliseconds request_timeout{60000};
    /// First retry delay; doubles with every further attempt
    std::chrono::milliseconds retry_backoff{300};

    ProgressCallback progress;

    /// Throws ConfigurationError on out-of-range values
    void validate() const;
};

// ============================================================================
// Downloader
// ============================================================================

/**
 * @brief Downloads one band of an image as a single array
 *
 * Queries the raster dimensions, plans a tile grid under the payload
 * ceiling, fetches the tiles in parallel and assembles them. Keeps the most
 * recent outcome for the accessors below; holds no other state across calls.
 */
class RasterDownloader {
public:
    explicit RasterDownloader(std::shared_ptr<ImageryClient> client,
                              const DownloadConfig& config = DownloadConfig{});
    ~RasterDownloader();

    RasterDownloader(const RasterDownloader&) = delete;
    RasterDownloader& operator=(const RasterDownloader&) = delete;

    /**
     * @brief Download a band with the configured limits
     *
     * @throws UnavailableError if the raster dimensions cannot be obtained
     * @throws ConfigurationError if the ceiling cannot hold one pixel
     */
    const DownloadOutcome& download(const std::string& image, const std::string& band);

    const DownloadOutcome& download(const std::string& image, const std::string& band,
                                    const CancellationToken& token);

    const DownloadOutcome& download(const std::string& image, const std::string& band,
                                    std::int64_t max_bytes, int concurrency, int max_retries);

    const DownloadOutcome& download(const std::string& image, const std::string& band,
                                    std::int64_t max_bytes, int concurrency, int max_retries,
                                    const CancellationToken& token);

    // Accessors for the most recent download
    const std::optional<RasterArray>& last_array() const;
    const std::vector<FailedTile>& last_failed_tiles() const;
    const std::optional<DownloadOutcome>& last_outcome() const;
    const std::optional<TileGrid>& last_grid() const;

    const DownloadConfig& get_config() const;
    void update_config(const DownloadConfig& config);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rasterdl
