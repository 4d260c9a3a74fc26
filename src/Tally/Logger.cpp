// =================================================================
// src/Tally/Logger.cpp
// =================================================================
// Implementation for the diagnostic logger.

#include "Tally/Logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace Tally {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(LogLevel console_level, const std::string& log_file) {
    m_console_level = console_level;
    m_use_color = isatty(STDERR_FILENO) != 0;
    m_initialized = true;

    m_log_file.reset();
    m_log_filename.clear();
    if (!log_file.empty()) {
        try {
            const std::filesystem::path target(log_file);
            if (target.has_parent_path()) {
                std::filesystem::create_directories(target.parent_path());
            }
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        }

        auto stream = std::make_unique<std::ofstream>(log_file, std::ios::app);
        if (stream->is_open()) {
            m_log_file = std::move(stream);
            m_log_filename = log_file;
        } else {
            std::cerr << "[WARN] Cannot open log file " << log_file << ", logging to console only" << std::endl;
        }
    }

    debug("Logger", "Logging system initialized", m_log_filename);
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logScanSummary(const std::string& root, size_t counted_files,
                            size_t skipped_files, long duration_ms) {
    std::ostringstream context;
    context << "Root: " << root << ", ";
    context << "Counted: " << counted_files << ", ";
    context << "Skipped: " << skipped_files << ", ";
    context << "Duration: " << duration_ms << "ms";

    info("TreeScanner", "Scan completed", context.str());

    if (skipped_files > 0) {
        warning("TreeScanner",
                "Some files could not be read and were left out of the statistics",
                "Files skipped: " + std::to_string(skipped_files));
    }
}

void Logger::logSessionStart(const std::string& root) {
    info("Session", "Session started", "Root: " + root);
}

void Logger::logSessionEnd(int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    if (m_log_file && m_log_file->is_open()) {
        m_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    if (!m_initialized) {
        // Initialize with defaults if not done yet
        initialize();
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (entry.level < m_console_level) {
        return;
    }

    std::cerr << formatEntry(entry, m_use_color) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_log_file) {
        return;
    }

    *m_log_file << formatEntry(entry, false) << '\n';

    // Flush errors immediately
    if (entry.level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": " << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace Tally
