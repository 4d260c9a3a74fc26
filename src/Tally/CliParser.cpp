// =================================================================
// src/Tally/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Tally/CliParser.hpp"
#include "Tally/LanguageRules.hpp"
#include "Tally/Translator.hpp"

namespace Tally {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "Tally: counts code, comment and blank lines per file extension.", "tally");

    m_app->add_option("path", m_commands.path, "Directory to analyze (default: current directory)");

    setupFilterOptions(*m_app);
    setupOutputOptions(*m_app);
    setupDiagnosticOptions(*m_app);

    // Normalize "-i py" and "-i .PY" to ".py" once parsing is done.
    m_app->callback([this]() {
        for (auto& ext : m_commands.include_extensions) {
            ext = LanguageRules::normalizeExtension(ext);
        }
    });

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupFilterOptions(CLI::App& app) {
    app.add_option("-e,--exclude", m_commands.exclude_dirs,
                   "Directory names to skip (default: .git __pycache__ node_modules .vscode .idea)");
    app.add_option("-i,--include", m_commands.include_extensions,
                   "Only count files with these extensions (e.g. .py .cpp)");
    app.add_flag("--count-unknown", m_commands.count_unknown,
                 "Count files with unrecognized extensions as plain text");
    app.add_option("--rules", m_commands.rules_file,
                   "YAML file with additional language comment rules");
}

void CliParser::setupOutputOptions(CLI::App& app) {
    app.add_option("--lang", m_commands.lang, "Report language (en/chs/cht/ja)")
        ->check(CLI::IsMember(Translator::supportedCodes()));
    app.add_option("--format", m_commands.format, "Report format (text/json)")
        ->check(CLI::IsMember({"text", "json"}));
}

void CliParser::setupDiagnosticOptions(CLI::App& app) {
    app.add_flag("-v,--verbose", m_commands.verbose, "Print debug diagnostics to stderr");
    app.add_option("--log-file", m_commands.log_file, "Also write diagnostics to this file");
}

} // namespace Tally
