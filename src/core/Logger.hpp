/**
 * @file Logger.hpp
 * @brief Centralized logging with per-component verbosity control
 *
 * Every component of the serializer logs through a Logger constructed with
 * its own name. Output is decided in exactly one place (outputMessage) and
 * written to stderr so that it never interleaves with data on stdout.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace xdi {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run aborted)
 * Level 2: Warnings (record skipped, header left unresolved)
 * Level 3: Information (run opened, finalized)
 * Level 4: Detailed information (document dispatch)
 * Level 5: Basic debugging (header field resolution)
 * Level 6: Detailed debugging (rendered values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

const char* to_string(LogLevel level);

/**
 * @brief Component logger with a single point of output control
 */
class Logger {
public:
    /**
     * @brief Logger for a named component ("facility")
     * @param component_name Facility name used for level overrides and as line prefix
     */
    explicit Logger(const std::string& component_name);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Identical consecutive messages are collapsed; the repeat count is
     * reported when a different message arrives or on flush().
     */
    void outputMessage(LogLevel level, const std::string& message) const;

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
     * @brief Flush pending repeat summaries and all output buffers
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "Serializer=6,HeaderResolver=3"
     * - Mixed: "4,Serializer=6"
     *
     * @param config Configuration string
     * @return false if any token could not be parsed (valid tokens are still applied)
     */
    static bool parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Log file shared by every logger
     * @param log_file Path (appends if exists), or nullopt to stop file logging
     * @return false if the file could not be opened
     */
    static bool setDefaultLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Facility level if set, else the global default
     */
    LogLevel getEffectiveLevel() const;

private:
    std::string component_name_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> default_file_stream_;

    void emitPendingRepeats() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace xdi
