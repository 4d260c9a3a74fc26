// =================================================================
// include/Tally/Translator.hpp
// =================================================================
// String tables for the localized report.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Tally {

/**
 * @brief Languages the report can be rendered in
 */
enum class ReportLanguage {
    En,     ///< English
    Chs,    ///< Simplified Chinese
    Cht,    ///< Traditional Chinese
    Ja      ///< Japanese
};

/**
 * @brief Lookup of report strings by key and language
 *
 * The language is always passed in explicitly; there is no process-wide
 * "current language".
 */
class Translator {
public:
    explicit Translator(ReportLanguage language = ReportLanguage::En);

    /**
     * @brief Translate an English key
     * @return The localized string, or the key itself when it has no entry
     */
    std::string tr(const std::string& key) const;

    ReportLanguage language() const { return m_language; }

    static std::string translate(const std::string& key, ReportLanguage language);

    /**
     * @brief Parse a language code such as "chs"
     * @return The language, or std::nullopt for an unsupported code
     */
    static std::optional<ReportLanguage> parseLanguage(const std::string& code);

    static std::string languageCode(ReportLanguage language);
    static std::vector<std::string> supportedCodes();

private:
    ReportLanguage m_language;
};

} // namespace Tally
