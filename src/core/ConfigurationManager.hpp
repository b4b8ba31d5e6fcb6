/**
 * @file ConfigurationManager.hpp
 * @brief Configuration file management for the raster downloader
 */

#pragma once

#include "raster_downloader.hpp"
#include "EarthEngineClient.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace rasterdl {

/**
 * @brief Configuration file manager for loading and saving settings
 *
 * Files hold one key=value pair per line; lines starting with '#' are
 * comments. Recognised keys:
 *
 *   max_bytes, concurrency, max_retries, request_timeout_ms, retry_backoff_ms
 *   base_url, api_version, project, access_token, user_agent,
 *   connect_timeout_seconds, metadata_timeout_seconds
 *   log_level (e.g. "3,ParallelDispatcher=5"), log_file
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @param filename Path to configuration file
     * @return true if successful, false if the file cannot be opened
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Convert to DownloadConfig
     * @throws ConfigurationError on malformed or out-of-range values
     */
    DownloadConfig to_download_config() const;

    /**
     * @brief Convert to EarthEngineClient::Config
     * @throws ConfigurationError on malformed timeouts
     */
    EarthEngineClient::Config to_client_config() const;

    void from_download_config(const DownloadConfig& config);
    void from_client_config(const EarthEngineClient::Config& config);

    /**
     * @brief Apply log_level and log_file to the Logger
     * @throws ConfigurationError if log_level does not parse
     */
    void apply_logging() const;

    // Value setters and getters
    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    /// @throws ConfigurationError if the stored value is not an integer
    std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;

    /// @throws ConfigurationError if the stored value is not an integer or does not fit an int
    int get_int32(const std::string& key, int default_value = 0) const;

private:
    std::map<std::string, std::string> config_values_;
};

} // namespace rasterdl
