/**
 * @file ImageryClient.hpp
 * @brief Capability interface of the upstream image-serving API
 */

#pragma once

#include "raster_downloader.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <chrono>

namespace rasterdl {

class CancellationToken;

/**
 * @brief Upstream service able to describe a band and serve sub-regions of it
 *
 * Implementations must be safe to call from several threads at once: the
 * dispatcher issues fetch_region() concurrently for different tiles.
 */
class ImageryClient {
public:
    virtual ~ImageryClient() = default;

    virtual const char* name() const = 0;

    /**
     * @brief Dimensions and sample type of one band of an image
     * @throws UnavailableError if the image or band cannot be described
     */
    virtual RasterSpec get_raster_spec(const std::string& image, const std::string& band) = 0;

    /**
     * @brief Encoded payload (GeoTIFF, possibly zipped) of a pixel window
     *
     * @param timeout Longest the request may take; an overrun is a TransientError
     * @param token   Cancellation raised by the caller; implementations abort
     *                in-flight transfers when it fires and throw CancelledError
     * @throws TransientError on timeout, rate limiting or server errors
     * @throws PermanentError on a request the service will never accept
     */
    virtual std::vector<std::uint8_t> fetch_region(const std::string& image,
                                                   const std::string& band,
                                                   const PixelWindow& window,
                                                   std::chrono::milliseconds timeout,
                                                   const CancellationToken& token) = 0;
};

} // namespace rasterdl
