/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity control
 *
 * Every component owns a Logger named after itself ("GeocodingResolver",
 * "NominatimGeocoder", ...). Verbosity is resolved per facility, so a
 * single component can be traced while the rest stays at INFO. All output
 * goes through one method and lands on stderr, keeping stdout free for
 * command results.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace locus {

/**
 * @brief Log levels
 *
 * Level 1: Errors (operation could not complete)
 * Level 2: Warnings (upstream unavailable, data discarded)
 * Level 3: Information (high-level)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (cache hits, request URLs)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

std::string to_string(LogLevel level);

class Logger {
public:
    Logger();

    /**
     * @brief Logger bound to a facility name
     * @param component_name Facility used for level lookup and message prefix
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Logger with explicit level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Single point of logging control
     *
     * Applies the verbosity check, collapses repeated identical messages
     * and forwards to doOutput().
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or change the log file
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush console and file output, emitting any pending repeat summary
     */
    void flush() const;

    // ------------------------------------------------------------------------
    // Facility registry
    // ------------------------------------------------------------------------

    /**
     * @brief Set log level for one facility
     *
     * @example
     * Logger::setFacilityLevel("NominatimGeocoder", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Fallback level for facilities without an explicit level
     */
    static void setDefaultLevel(LogLevel level);

    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * - "5" sets the default to DEBUG
     * - "NearbySearchEngine=6,default=3" sets one facility and the default
     * - "4,PostalLookupService=6" mixes both forms
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Route every logger's output to a file as well as stderr
     *
     * Used by the command-line driver; passing nullopt disables it.
     */
    static void setSharedLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Facility level, then instance level, then global default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Repeat collapsing state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> shared_file_stream_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<std::ofstream> openLogFile(const std::string& path);

    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace locus
