#pragma once

/**
 * @file DownloadErrors.hpp
 * @brief Exception taxonomy of the raster downloader
 */

#include <stdexcept>
#include <string>

namespace rasterdl {

/**
 * @brief Base of every error raised by the downloader
 */
class RasterDownloadError : public std::runtime_error {
public:
    explicit RasterDownloadError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid limits, e.g. a ceiling smaller than one pixel
 *
 * Raised before any request is made; never retried.
 */
class ConfigurationError : public RasterDownloadError {
public:
    explicit ConfigurationError(const std::string& message)
        : RasterDownloadError("Configuration error: " + message) {}
};

/**
 * @brief Raster metadata could not be obtained (image or band missing,
 * service unreachable)
 */
class UnavailableError : public RasterDownloadError {
public:
    explicit UnavailableError(const std::string& message)
        : RasterDownloadError("Raster unavailable: " + message) {}
};

/**
 * @brief Timeout, rate limit or server-side hiccup; worth retrying
 */
class TransientError : public RasterDownloadError {
public:
    explicit TransientError(const std::string& message)
        : RasterDownloadError(message) {}
};

/**
 * @brief Request that will never succeed as issued
 */
class PermanentError : public RasterDownloadError {
public:
    explicit PermanentError(const std::string& message)
        : RasterDownloadError(message) {}
};

/**
 * @brief Payload could not be parsed into the expected shape or type
 */
class DecodeError : public RasterDownloadError {
public:
    explicit DecodeError(const std::string& message)
        : RasterDownloadError("Decode error: " + message) {}
};

/**
 * @brief Work abandoned because the caller cancelled the download
 */
class CancelledError : public RasterDownloadError {
public:
    explicit CancelledError(const std::string& message = "download cancelled")
        : RasterDownloadError(message) {}
};

} // namespace rasterdl
