// =================================================================
// src/Tally/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Tally/Core.hpp"
#include "Tally/Aggregator.hpp"
#include "Tally/Errors.hpp"
#include "Tally/LanguageRules.hpp"
#include "Tally/Logger.hpp"
#include "Tally/Reporter.hpp"
#include "Tally/Translator.hpp"
#include <chrono>

namespace Tally {

Core::Core(const Commands& commands, std::ostream& out)
    : m_commands(commands),
      m_out(out) {}

int Core::run() {
    Logger& logger = Logger::getInstance();
    logger.initialize(m_commands.verbose ? LogLevel::DEBUG : LogLevel::WARNING,
                      m_commands.log_file);

    auto start = std::chrono::steady_clock::now();
    logger.logSessionStart(m_commands.path);

    int exit_code = 0;
    try {
        exit_code = execute();
    } catch (const FatalPathError& e) {
        logger.critical("Core", "Cannot scan directory", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    } catch (const ConfigError& e) {
        logger.critical("Core", "Invalid configuration", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger.logSessionEnd(exit_code, duration.count());
    logger.flush();
    return exit_code;
}

ScanConfig Core::buildScanConfig() const {
    ScanConfig config;
    config.root_path = m_commands.path.empty() ? "." : m_commands.path;

    for (const auto& ext : m_commands.include_extensions) {
        config.include_extensions.insert(LanguageRules::normalizeExtension(ext));
    }

    if (m_commands.exclude_dirs.empty()) {
        config.exclude_dir_names = ScanConfig::defaultExcludedDirs();
    } else {
        config.exclude_dir_names.insert(m_commands.exclude_dirs.begin(),
                                        m_commands.exclude_dirs.end());
    }

    config.count_unknown_as_text = m_commands.count_unknown;

    auto language = Translator::parseLanguage(m_commands.lang);
    if (!language) {
        LOG_WARNING("Core", "Language '" + m_commands.lang + "' not supported, using 'en'");
    }
    config.language = language.value_or(ReportLanguage::En);
    return config;
}

int Core::execute() {
    LanguageRules rules;
    if (!m_commands.rules_file.empty()) {
        rules.loadFromFile(m_commands.rules_file);
    }

    const ScanConfig config = buildScanConfig();
    LOG_DEBUG("Core", "Scanning " + config.root_path + " with " +
              std::to_string(config.exclude_dir_names.size()) + " excluded directory names");

    TreeScanner scanner(rules);
    const ScanResult result = scanner.scan(config);
    const AggregateReport report = Aggregator::aggregate(result, rules);

    auto format = Reporter::parseFormat(m_commands.format);
    if (!format) {
        LOG_WARNING("Core", "Unknown report format '" + m_commands.format + "', using text");
    }

    Reporter reporter(config.language);
    reporter.render(report, format.value_or(ReportFormat::Text), m_out);
    return 0;
}

} // namespace Tally
