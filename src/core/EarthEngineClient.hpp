/**
 * @file EarthEngineClient.hpp
 * @brief Imagery client for the Earth Engine REST API
 *
 * Reads band metadata from the asset resource and pixel windows through
 * the getPixels method, over libcurl.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "ImageryClient.hpp"
#include "Logger.hpp"
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rasterdl {

/**
 * @brief How a response status should be treated
 */
enum class HttpDisposition {
    OK,
    TRANSIENT,  ///< Retry later (rate limiting, server hiccups)
    PERMANENT   ///< Retrying the same request cannot help
};

/**
 * @brief Earth Engine implementation of ImageryClient
 *
 * Image identifiers are either full asset names ("projects/p/assets/x") or
 * paths resolved against the configured project. Safe for concurrent
 * fetch_region() calls; each call uses its own curl handle.
 */
class EarthEngineClient : public ImageryClient {
public:
    /**
     * @brief Connection configuration
     */
    struct Config {
        std::string base_url = "https://earthengine.googleapis.com";
        std::string api_version = "v1";
        std::string project = "earthengine-public";
        std::string access_token;  // OAuth2 bearer token, acquired elsewhere
        std::string user_agent = "rasterdl/1.0";
        int connect_timeout_seconds = 10;
        int metadata_timeout_seconds = 30;
    };

    EarthEngineClient();
    explicit EarthEngineClient(const Config& config);

    const char* name() const override { return "earthengine"; }

    RasterSpec get_raster_spec(const std::string& image, const std::string& band) override;

    std::vector<std::uint8_t> fetch_region(const std::string& image,
                                           const std::string& band,
                                           const PixelWindow& window,
                                           std::chrono::milliseconds timeout,
                                           const CancellationToken& token) override;

    const Config& config() const { return config_; }

    /// Full asset name of an image identifier
    std::string asset_name(const std::string& image) const;

    /**
     * @brief Extract one band's RasterSpec from an asset resource
     * @throws UnavailableError if the band is missing or the JSON is malformed
     */
    static RasterSpec parse_raster_spec(const std::string& asset_json, const std::string& band);

    /**
     * @brief getPixels request body for a window of a band
     *
     * The band grid is kept; its origin moves to the window's top-left pixel
     * and its dimensions shrink to the window.
     */
    static std::string build_pixels_request(const std::string& band, const GeoTransform& geo,
                                            const PixelWindow& window);

    static HttpDisposition classify_http_status(long status);

    /// "message" of a Google API error body, or the raw body when not JSON
    static std::string extract_error_message(const std::string& body);

private:
    struct HttpResponse {
        long status = 0;
        std::vector<std::uint8_t> body;
    };

    Config config_;
    Logger logger_;

    // Band grids learned from get_raster_spec(), keyed by (asset, band)
    std::map<std::pair<std::string, std::string>, GeoTransform> grids_;
    std::mutex grids_mutex_;

    /**
     * @brief Perform one HTTP exchange
     *
     * @throws TransientError on timeouts and connection failures
     * @throws PermanentError on other transport failures
     * @throws CancelledError when the token fires mid-transfer
     */
    HttpResponse perform(const std::string& url, const std::string* post_body,
                         long timeout_ms, const CancellationToken* token) const;

    std::string endpoint(const std::string& asset, const std::string& method = "") const;
    // Metadata lookup; a token makes the request abortable
    RasterSpec describe(const std::string& image, const std::string& band,
                        const CancellationToken* token);
    GeoTransform grid_for(const std::string& image, const std::string& band,
                          const CancellationToken& token);
};

} // namespace rasterdl
