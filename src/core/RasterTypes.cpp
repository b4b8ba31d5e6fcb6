/**
 * @file RasterTypes.cpp
 * @brief Helpers of the core raster, tile and result types
 */

#include "raster_downloader.hpp"
#include <sstream>
#include <limits>

namespace rasterdl {

int pixel_bytes(DataType type) {
    switch (type) {
        case DataType::UINT8:
        case DataType::INT8:    return 1;
        case DataType::UINT16:
        case DataType::INT16:   return 2;
        case DataType::UINT32:
        case DataType::INT32:
        case DataType::FLOAT32: return 4;
        case DataType::FLOAT64: return 8;
    }
    return 8;
}

const char* data_type_name(DataType type) {
    switch (type) {
        case DataType::UINT8:   return "uint8";
        case DataType::INT8:    return "int8";
        case DataType::UINT16:  return "uint16";
        case DataType::INT16:   return "int16";
        case DataType::UINT32:  return "uint32";
        case DataType::INT32:   return "int32";
        case DataType::FLOAT32: return "float32";
        case DataType::FLOAT64: return "float64";
    }
    return "unknown";
}

DataType integer_type_for_range(double min_value, double max_value) {
    if (min_value >= 0) {
        if (max_value <= std::numeric_limits<std::uint8_t>::max()) return DataType::UINT8;
        if (max_value <= std::numeric_limits<std::uint16_t>::max()) return DataType::UINT16;
        if (max_value <= std::numeric_limits<std::uint32_t>::max()) return DataType::UINT32;
        return DataType::FLOAT64;
    }

    if (min_value >= std::numeric_limits<std::int8_t>::min() &&
        max_value <= std::numeric_limits<std::int8_t>::max()) return DataType::INT8;
    if (min_value >= std::numeric_limits<std::int16_t>::min() &&
        max_value <= std::numeric_limits<std::int16_t>::max()) return DataType::INT16;
    if (min_value >= std::numeric_limits<std::int32_t>::min() &&
        max_value <= std::numeric_limits<std::int32_t>::max()) return DataType::INT32;

    // Wider than 32 bits: the service delivers it as double
    return DataType::FLOAT64;
}

GeoTransform GeoTransform::shifted_to(std::int64_t row, std::int64_t col) const {
    GeoTransform shifted = *this;
    auto origin = apply(static_cast<double>(col), static_cast<double>(row));
    shifted.coefficients[0] = origin.first;
    shifted.coefficients[3] = origin.second;
    return shifted;
}

std::string TileDescriptor::to_string() const {
    std::ostringstream ss;
    ss << "Tile[" << row_start << ":" << row_end << "," << col_start << ":" << col_end << "]";
    return ss.str();
}

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::TRANSIENT: return "transient";
        case FailureKind::PERMANENT: return "permanent";
        case FailureKind::DECODE:    return "decode";
        case FailureKind::CANCELLED: return "cancelled";
    }
    return "unknown";
}

TileResult TileResult::success(const TileDescriptor& tile, RasterArray data, int attempts) {
    TileResult result;
    result.tile = tile;
    result.attempts = attempts;
    result.payload = std::move(data);
    return result;
}

TileResult TileResult::failure(const TileDescriptor& tile, FailureKind kind,
                               const std::string& detail, int attempts) {
    TileResult result;
    result.tile = tile;
    result.attempts = attempts;
    result.payload = TileFailure{kind, detail};
    return result;
}

void DownloadConfig::validate() const {
    if (max_bytes <= 0) {
        throw ConfigurationError("max_bytes must be positive, got " + std::to_string(max_bytes));
    }
    if (concurrency < 1) {
        throw ConfigurationError("concurrency must be at least 1, got " + std::to_string(concurrency));
    }
    if (max_retries < 0) {
        throw ConfigurationError("max_retries must not be negative, got " + std::to_string(max_retries));
    }
    if (request_timeout.count() <= 0) {
        throw ConfigurationError("request_timeout must be positive");
    }
    if (retry_backoff.count() < 0) {
        throw ConfigurationError("retry_backoff must not be negative");
    }
}

} // namespace rasterdl
