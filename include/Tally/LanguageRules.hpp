// =================================================================
// include/Tally/LanguageRules.hpp
// =================================================================
// Maps file extensions to the comment syntax of their language.

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Tally {

/**
 * @brief Comment syntax of one language
 */
struct LanguageRule {
    std::string language;                       ///< Display name, e.g. "C++"
    std::vector<std::string> extensions;        ///< Lowercase, with leading dot
    std::vector<std::string> line_comment_markers;
    std::vector<std::pair<std::string, std::string>> block_comment_pairs; ///< Ordered (open, close)

    bool hasCommentSyntax() const {
        return !line_comment_markers.empty() || !block_comment_pairs.empty();
    }
};

/**
 * @brief Lookup table from file extension to LanguageRule
 *
 * Extensions are matched case-insensitively. The table starts with the
 * built-in languages and can be extended from a YAML rules file.
 */
class LanguageRules {
public:
    /**
     * @brief Construct a table holding the built-in languages
     */
    LanguageRules();

    /**
     * @brief Find the rule for an extension
     * @param extension Extension with or without leading dot, any case
     * @return The rule, or std::nullopt when the extension is unknown
     */
    std::optional<LanguageRule> lookup(const std::string& extension) const;

    /**
     * @brief Check whether an extension has a rule
     */
    bool isKnown(const std::string& extension) const;

    /**
     * @brief Register a rule for all of its extensions
     *
     * A rule registered later replaces any earlier rule for the same extension.
     */
    void addRule(LanguageRule rule);

    /**
     * @brief Load additional rules from a YAML file
     * @param path Path to the rules file
     * @return Number of languages loaded
     * @throws ConfigError if the file cannot be read or has the wrong shape
     */
    size_t loadFromFile(const std::string& path);

    /**
     * @brief Number of extensions with a rule
     */
    size_t size() const { return m_by_extension.size(); }

    /**
     * @brief Lowercase an extension and make sure it starts with a dot
     */
    static std::string normalizeExtension(const std::string& extension);

    /**
     * @brief Rule without any comment markers for an unrecognized extension
     */
    static LanguageRule plainText(const std::string& extension);

    /**
     * @brief The built-in language table
     */
    static std::vector<LanguageRule> defaults();

private:
    std::unordered_map<std::string, LanguageRule> m_by_extension;
};

} // namespace Tally
