/**
 * @file TileFetcher.hpp
 * @brief Fetches and decodes a single tile
 */

#pragma once

#include "raster_downloader.hpp"
#include "ImageryClient.hpp"
#include "TileDecoder.hpp"
#include "Logger.hpp"
#include <chrono>
#include <string>

namespace rasterdl {

/**
 * @brief One request to the upstream service for one tile
 *
 * Maps the client's exceptions onto failure kinds so that callers only see
 * TileResult values: timeouts and rate limits become TRANSIENT, rejected
 * requests PERMANENT, unreadable or mistyped payloads DECODE and aborted transfers
 * CANCELLED. No caching.
 */
class TileFetcher {
public:
    TileFetcher(ImageryClient& client, std::string image, DataType data_type,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(60000));

    /**
     * @brief Fetch and decode one tile
     *
     * @param tile    Tile to request
     * @param band    Band identifier
     * @param token   Caller cancellation
     * @param attempt Attempt number recorded in the result (1 for the first)
     */
    TileResult fetch(const TileDescriptor& tile, const std::string& band,
                     const CancellationToken& token, int attempt = 1) const;

    const std::string& image() const { return image_; }
    DataType data_type() const { return data_type_; }

private:
    ImageryClient& client_;
    std::string image_;
    DataType data_type_;
    std::chrono::milliseconds timeout_;
    TileDecoder decoder_;
    Logger logger_;
};

} // namespace rasterdl
