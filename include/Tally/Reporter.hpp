// =================================================================
// include/Tally/Reporter.hpp
// =================================================================
// Renders aggregated statistics as localized text or JSON.

#pragma once

#include "Tally/Aggregator.hpp"
#include "Tally/Translator.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace Tally {

enum class ReportFormat {
    Text,
    Json
};

class Reporter {
public:
    explicit Reporter(ReportLanguage language = ReportLanguage::En);

    /**
     * @brief Write the report in the requested format
     */
    void render(const AggregateReport& report, ReportFormat format, std::ostream& out) const;

    /**
     * @brief Human-readable report, one block per extension plus the grand total
     */
    void renderText(const AggregateReport& report, std::ostream& out) const;

    /**
     * @brief Machine-readable report; keys are not localized
     */
    static nlohmann::json toJson(const AggregateReport& report);

    static std::optional<ReportFormat> parseFormat(const std::string& name);

private:
    void renderSummary(const ExtensionSummary& summary, const std::string& files_label,
                       std::ostream& out) const;

    Translator m_translator;
};

} // namespace Tally
