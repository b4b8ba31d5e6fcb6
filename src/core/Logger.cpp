/**
 * @file Logger.cpp
 * @brief Implementation of the centralized logger
 */

#include "Logger.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <sstream>
#include <algorithm>

namespace rasterdl {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::file_stream_;
std::mutex Logger::sink_mutex_;

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN ";
        case LogLevel::INFO:     return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "?????";
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

} // namespace

Logger::Logger() = default;

Logger::Logger(const std::string& component_name)
    : component_name_(component_name) {
}

Logger::Logger(const std::string& component_name, LogLevel level)
    : component_name_(component_name), current_level_(level) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    flushRepeatsLocked();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    if (!shouldOutput(level)) return;

    std::lock_guard<std::mutex> lock(state_mutex_);

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    flushRepeatsLocked();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::flushRepeatsLocked() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] " << level_tag(level) << " ";
    if (!component_name_.empty()) {
        line << component_name_ << ": ";
    }
    line << message;

    std::lock_guard<std::mutex> lock(sink_mutex_);
    std::ostream& out = (level <= LogLevel::WARNING) ? std::cerr : std::cout;
    out << line.str() << std::endl;

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        flushRepeatsLocked();
    }

    std::lock_guard<std::mutex> lock(sink_mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Process-wide settings
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = facility_levels_.find(facility);
    return it != facility_levels_.end() ? it->second : default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return true;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    bool all_valid = true;
    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        std::string facility = "default";
        std::string level_str = token;

        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            facility = trim(token.substr(0, equals_pos));
            level_str = trim(token.substr(equals_pos + 1));
        }

        int level_int = 0;
        try {
            level_int = std::stoi(level_str);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
            all_valid = false;
            continue;
        }

        LogLevel level = static_cast<LogLevel>(std::clamp(level_int, 1, 6));
        if (facility == "default") {
            default_level_ = level;
        } else {
            facility_levels_[facility] = level;
        }
    }

    return all_valid;
}

void Logger::setLogFile(const std::optional<std::string>& path) {
    std::lock_guard<std::mutex> lock(sink_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (!path.has_value()) return;

    try {
        std::filesystem::path log_path(path.value());
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        file_stream_ = std::make_shared<std::ofstream>(path.value(), std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << path.value() << std::endl;
            file_stream_.reset();
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        file_stream_.reset();
    }
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    if (current_level_.has_value()) {
        return *current_level_;
    }

    return default_level_;
}

} // namespace rasterdl
