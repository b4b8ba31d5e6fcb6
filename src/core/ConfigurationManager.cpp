/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the raster downloader
 */

#include "ConfigurationManager.hpp"
#include "Logger.hpp"
#include <fstream>
#include <limits>

namespace rasterdl {

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r");
    return str.substr(start, end - start + 1);
}

} // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    // Simple key=value parser
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        config_values_[trim(line.substr(0, eq_pos))] = trim(line.substr(eq_pos + 1));
    }

    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# Raster Downloader Configuration" << std::endl;
    file << "# Generated automatically" << std::endl;
    file << std::endl;

    for (const auto& [key, value] : config_values_) {
        file << key << "=" << value << std::endl;
    }

    return static_cast<bool>(file);
}

std::int64_t ConfigurationManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        std::int64_t value = std::stoll(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw ConfigurationError(key + " is not an integer: '" + it->second + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigurationError(key + " is not an integer: '" + it->second + "'");
    }
}

int ConfigurationManager::get_int32(const std::string& key, int default_value) const {
    const std::int64_t value = get_int(key, default_value);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigurationError(key + " is out of range: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

DownloadConfig ConfigurationManager::to_download_config() const {
    DownloadConfig config;

    config.max_bytes = get_int("max_bytes", config.max_bytes);
    config.concurrency = get_int32("concurrency", config.concurrency);
    config.max_retries = get_int32("max_retries", config.max_retries);
    config.request_timeout = std::chrono::milliseconds(
        get_int("request_timeout_ms", config.request_timeout.count()));
    config.retry_backoff = std::chrono::milliseconds(
        get_int("retry_backoff_ms", config.retry_backoff.count()));

    config.validate();
    return config;
}

EarthEngineClient::Config ConfigurationManager::to_client_config() const {
    EarthEngineClient::Config config;

    config.base_url = get_string("base_url", config.base_url);
    config.api_version = get_string("api_version", config.api_version);
    config.project = get_string("project", config.project);
    config.access_token = get_string("access_token", config.access_token);
    config.user_agent = get_string("user_agent", config.user_agent);
    config.connect_timeout_seconds = get_int32("connect_timeout_seconds", config.connect_timeout_seconds);
    config.metadata_timeout_seconds = get_int32("metadata_timeout_seconds", config.metadata_timeout_seconds);

    if (config.base_url.empty()) {
        throw ConfigurationError("base_url must not be empty");
    }
    if (config.connect_timeout_seconds <= 0 || config.metadata_timeout_seconds <= 0) {
        throw ConfigurationError("client timeouts must be positive");
    }

    return config;
}

void ConfigurationManager::from_download_config(const DownloadConfig& config) {
    set_value("max_bytes", std::to_string(config.max_bytes));
    set_value("concurrency", std::to_string(config.concurrency));
    set_value("max_retries", std::to_string(config.max_retries));
    set_value("request_timeout_ms", std::to_string(config.request_timeout.count()));
    set_value("retry_backoff_ms", std::to_string(config.retry_backoff.count()));
}

void ConfigurationManager::from_client_config(const EarthEngineClient::Config& config) {
    set_value("base_url", config.base_url);
    set_value("api_version", config.api_version);
    set_value("project", config.project);
    // Tokens are short-lived; never persisted
    set_value("user_agent", config.user_agent);
    set_value("connect_timeout_seconds", std::to_string(config.connect_timeout_seconds));
    set_value("metadata_timeout_seconds", std::to_string(config.metadata_timeout_seconds));
}

void ConfigurationManager::apply_logging() const {
    if (has_value("log_level")) {
        const std::string spec = get_string("log_level");
        if (!Logger::parseLogConfig(spec)) {
            throw ConfigurationError("invalid log_level '" + spec + "'");
        }
    }

    if (has_value("log_file")) {
        const std::string path = get_string("log_file");
        Logger::setLogFile(path.empty() ? std::nullopt : std::optional<std::string>(path));
    }
}

} // namespace rasterdl
