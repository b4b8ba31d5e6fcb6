/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity
 *
 * Every component owns a Logger named after itself (its facility). All
 * output goes through a single mutex-guarded sink so lines written from
 * worker threads never interleave.
 */

#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace rasterdl {

/**
 * @brief Log levels
 *
 * Level 1: Errors (a request or download failed)
 * Level 2: Warnings (a tile failed, a retry was scheduled)
 * Level 3: Information (one line per download stage)
 * Level 4: Detailed information (per tile events)
 * Level 5: Basic debugging (requests, decoded shapes)
 * Level 6: Detailed debugging (payload sizes, timings)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Component-scoped logger
 *
 * The effective threshold is, in order: the facility level registered for
 * the component name, the level passed to the constructor, the global
 * default.
 */
class Logger {
public:
    Logger();
    explicit Logger(const std::string& component_name);
    Logger(const std::string& component_name, LogLevel level);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Consecutive identical messages are collapsed into one line followed by
     * a repeat count.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    std::optional<LogLevel> getLogLevel() const { return current_level_; }

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }
    void trace(const std::string& message) const { outputMessage(LogLevel::TRACE, message); }

    /// Flush pending repeat summaries and the sinks
    void flush() const;

    const std::string& component() const { return component_name_; }

    LogLevel getEffectiveLevel() const;

    // ========================================================================
    // Process-wide settings
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);
    static void clearFacilityLevels();

    /**
     * @brief Apply a log configuration string
     *
     * "5" sets the default to DEBUG; "ParallelDispatcher=6,default=3" sets a
     * facility and the default; "4,EarthEngineClient=6" mixes both forms.
     * Levels are clamped to [1, 6].
     *
     * @return false if any token could not be parsed (valid tokens still apply)
     */
    static bool parseLogConfig(const std::string& config);

    /**
     * @brief Mirror all output to a file (appending), or stop with nullopt
     */
    static void setLogFile(const std::optional<std::string>& path);

private:
    std::string component_name_;
    std::optional<LogLevel> current_level_;

    // Deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_ = LogLevel::INFO;
    mutable int repeat_count_ = 0;
    mutable bool has_last_message_ = false;
    mutable std::mutex state_mutex_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<std::ofstream> file_stream_;
    static std::mutex sink_mutex_;

    void flushRepeatsLocked() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace rasterdl
