// =================================================================
// src/Tally/Reporter.cpp
// =================================================================
// Implementation for report rendering.

#include "Tally/Reporter.hpp"
#include <iomanip>
#include <sstream>

namespace Tally {

namespace {

const std::string kRuler(80, '=');

std::string percent(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
    return oss.str();
}

nlohmann::json summaryToJson(const ExtensionSummary& summary) {
    nlohmann::json node;
    if (!summary.extension.empty()) {
        node["extension"] = summary.extension;
        node["language"] = summary.language;
    }
    node["files"] = summary.file_count;
    node["total_lines"] = summary.total_lines;
    node["code_lines"] = summary.code_lines;
    node["comment_lines"] = summary.comment_lines;
    node["blank_lines"] = summary.blank_lines;
    node["code_ratio"] = summary.code_ratio;
    node["comment_ratio"] = summary.comment_ratio;
    node["blank_ratio"] = summary.blank_ratio;
    return node;
}

} // namespace

Reporter::Reporter(ReportLanguage language)
    : m_translator(language) {}

void Reporter::render(const AggregateReport& report, ReportFormat format, std::ostream& out) const {
    if (format == ReportFormat::Json) {
        out << toJson(report).dump(2) << std::endl;
        return;
    }
    renderText(report, out);
}

void Reporter::renderText(const AggregateReport& report, std::ostream& out) const {
    out << kRuler << "\n";
    out << m_translator.tr("Code Line Statistics Results") << "\n";
    out << kRuler << "\n";

    for (const auto& [extension, summary] : report.groups) {
        if (summary.file_count == 0) {
            continue;
        }
        out << "\n" << extension;
        if (!summary.language.empty()) {
            out << " (" << summary.language << ")";
        }
        out << ":\n";
        renderSummary(summary, m_translator.tr("File Count"), out);
    }

    out << "\n" << kRuler << "\n";
    out << m_translator.tr("Total") << ":\n";
    renderSummary(report.total, m_translator.tr("Files"), out);
    out << "  " << m_translator.tr("Skipped Files") << ": " << report.skippedCount() << "\n";

    for (const auto& skipped : report.skipped) {
        out << m_translator.tr("Failed to read file") << " " << skipped.path
            << ": " << skipped.reason << "\n";
    }
    out.flush();
}

void Reporter::renderSummary(const ExtensionSummary& summary, const std::string& files_label,
                             std::ostream& out) const {
    out << "  " << files_label << ": " << summary.file_count << "\n";
    out << "  " << m_translator.tr("Total Lines") << ": " << summary.total_lines << "\n";
    out << "  " << m_translator.tr("Code Lines") << ": " << summary.code_lines << "\n";
    out << "  " << m_translator.tr("Comment Lines") << ": " << summary.comment_lines << "\n";
    out << "  " << m_translator.tr("Blank Lines") << ": " << summary.blank_lines << "\n";

    if (summary.total_lines > 0) {
        out << "  " << m_translator.tr("Code Line Ratio") << ": " << percent(summary.code_ratio) << "\n";
        out << "  " << m_translator.tr("Comment Line Ratio") << ": " << percent(summary.comment_ratio) << "\n";
        out << "  " << m_translator.tr("Blank Line Ratio") << ": " << percent(summary.blank_ratio) << "\n";
    }
}

nlohmann::json Reporter::toJson(const AggregateReport& report) {
    nlohmann::json root;
    root["extensions"] = nlohmann::json::array();
    for (const auto& entry : report.groups) {
        root["extensions"].push_back(summaryToJson(entry.second));
    }
    root["total"] = summaryToJson(report.total);

    root["skipped"] = nlohmann::json::array();
    for (const auto& skipped : report.skipped) {
        root["skipped"].push_back({{"path", skipped.path}, {"reason", skipped.reason}});
    }
    return root;
}

std::optional<ReportFormat> Reporter::parseFormat(const std::string& name) {
    if (name == "text") return ReportFormat::Text;
    if (name == "json") return ReportFormat::Json;
    return std::nullopt;
}

} // namespace Tally
