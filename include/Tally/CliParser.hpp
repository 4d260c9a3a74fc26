// =================================================================
// include/Tally/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Tally {

// A simple struct to hold the parsed options.
struct Commands {
    std::string path = ".";
    std::vector<std::string> exclude_dirs;       // Empty: use the default exclusions
    std::vector<std::string> include_extensions; // Normalized to ".ext"
    std::string lang = "en";
    std::string format = "text";
    std::string rules_file;
    bool count_unknown = false;
    bool verbose = false;
    std::string log_file;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupFilterOptions(CLI::App& app);
    void setupOutputOptions(CLI::App& app);
    void setupDiagnosticOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Tally
