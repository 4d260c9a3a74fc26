// =================================================================
// include/Tally/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Tally/CliParser.hpp"
#include "Tally/TreeScanner.hpp"
#include <iostream>
#include <ostream>

namespace Tally {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @param out Stream that receives the report.
     */
    explicit Core(const Commands& commands, std::ostream& out = std::cout);

    /**
     * @brief Scans, aggregates and reports according to the parsed commands.
     * @return 0 when the scan completed (even with skipped files), 1 on a fatal error.
     */
    int run();

    /**
     * @brief Translate the parsed commands into an immutable scan configuration.
     */
    ScanConfig buildScanConfig() const;

private:
    int execute();

    const Commands& m_commands;
    std::ostream& m_out;
};

} // namespace Tally
