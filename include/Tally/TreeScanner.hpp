// =================================================================
// include/Tally/TreeScanner.hpp
// =================================================================
// Header for directory traversal and per-file classification.

#pragma once

#include "Tally/FileClassifier.hpp"
#include "Tally/LanguageRules.hpp"
#include "Tally/Translator.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace Tally {

/**
 * @brief Settings for one scan, immutable while the scan runs
 */
struct ScanConfig {
    std::string root_path = ".";
    std::unordered_set<std::string> include_extensions;   ///< Empty means "all known"
    std::unordered_set<std::string> exclude_dir_names;    ///< Matched against directory base names
    bool count_unknown_as_text = false;
    ReportLanguage language = ReportLanguage::En;

    /**
     * @brief Directory names pruned when no exclusions are given
     */
    static std::unordered_set<std::string> defaultExcludedDirs();
};

/**
 * @brief A file left out of the statistics because it could not be read
 */
struct SkippedFile {
    std::string path;
    std::string reason;
};

/**
 * @brief Output of a scan: classified files plus the skip tally
 */
struct ScanResult {
    std::vector<FileStat> files;        ///< Ordered by path
    std::vector<SkippedFile> skipped;   ///< Ordered by path

    size_t skippedCount() const { return skipped.size(); }
};

/**
 * @brief Walks a directory tree and classifies every accepted file
 *
 * The TreeScanner prunes excluded directories by base name, never follows
 * symlinked directories, and filters files by extension. Files that cannot be
 * read are recorded as skipped; they never abort the scan.
 */
class TreeScanner {
public:
    /**
     * @brief Construct a scanner over a rules table
     * @param rules Language rules; must outlive the scanner
     */
    explicit TreeScanner(const LanguageRules& rules);

    /**
     * @brief Scan the tree described by the configuration
     * @param config Root, filters and policies for this scan
     * @return Classified files and skipped files
     * @throws FatalPathError if the root is missing, not a directory, or unreadable
     */
    ScanResult scan(const ScanConfig& config) const;

    /**
     * @brief Lowercase extension of a file, or an empty string when it has none
     */
    static std::string extensionOf(const std::filesystem::path& path);

private:
    const LanguageRules& m_rules;

    void walkDirectory(const std::filesystem::path& dir,
                       const ScanConfig& config,
                       const std::unordered_set<std::string>& includes,
                       ScanResult& result) const;

    void visitFile(const std::filesystem::path& file,
                   const ScanConfig& config,
                   const std::unordered_set<std::string>& includes,
                   ScanResult& result) const;

    /**
     * @brief Rule to classify a file with, or std::nullopt when it is filtered out
     */
    std::optional<LanguageRule> ruleFor(const std::string& extension,
                                        const ScanConfig& config,
                                        const std::unordered_set<std::string>& includes) const;
};

} // namespace Tally
