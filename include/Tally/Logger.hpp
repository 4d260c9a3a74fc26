// =================================================================
// include/Tally/Logger.hpp
// =================================================================
// Header for leveled diagnostic logging.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <string>

namespace Tally {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide diagnostic logger
 *
 * Console output goes to stderr so that the report on stdout stays
 * machine-readable. A log file can be attached to mirror every entry,
 * whatever the console level.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param console_level Minimum level written to stderr
     * @param log_file Optional file that receives a copy of every entry
     */
    void initialize(LogLevel console_level = LogLevel::WARNING,
                    const std::string& log_file = "");

    LogLevel consoleLogLevel() const { return m_console_level; }
    const std::string& logFilename() const { return m_log_filename; }

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a directory scan
     * @param root Scanned root directory
     * @param counted_files Files that were classified
     * @param skipped_files Files skipped because of read errors
     * @param duration_ms Scan duration in milliseconds
     */
    void logScanSummary(const std::string& root, size_t counted_files,
                        size_t skipped_files, long duration_ms);

    /**
     * @brief Log session start
     * @param root Directory about to be scanned
     */
    void logSessionStart(const std::string& root);

    /**
     * @brief Log session end
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(int exit_code, long duration_ms);

    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel m_console_level = LogLevel::WARNING;
    bool m_use_color = false;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_log_file;
    std::string m_log_filename;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Tally::Logger::getInstance().debug(component, message)

#define LOG_WARNING(component, message) \
    Tally::Logger::getInstance().warning(component, message)

} // namespace Tally
