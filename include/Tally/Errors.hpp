// =================================================================
// include/Tally/Errors.hpp
// =================================================================
// Exception types raised while scanning and reporting.

#pragma once

#include <stdexcept>
#include <string>

namespace Tally {

/**
 * @brief Base class for all errors raised by Tally
 */
class TallyError : public std::runtime_error {
public:
    explicit TallyError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The scan root is missing, not a directory, or cannot be listed.
 *
 * Fatal for the whole run: nothing is scanned.
 */
class FatalPathError : public TallyError {
public:
    explicit FatalPathError(const std::string& message)
        : TallyError(message) {}
};

/**
 * @brief A single file could not be read or decoded as text.
 *
 * Caught by TreeScanner and turned into a skipped file.
 */
class ReadError : public TallyError {
public:
    ReadError(const std::string& path, const std::string& reason)
        : TallyError(path + ": " + reason), m_path(path), m_reason(reason) {}

    const std::string& path() const { return m_path; }
    const std::string& reason() const { return m_reason; }

private:
    std::string m_path;
    std::string m_reason;
};

/**
 * @brief A language rules file is missing or malformed.
 */
class ConfigError : public TallyError {
public:
    explicit ConfigError(const std::string& message)
        : TallyError(message) {}
};

} // namespace Tally
