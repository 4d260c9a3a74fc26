// =================================================================
// include/Tally/Aggregator.hpp
// =================================================================
// Folds per-file counts into per-extension summaries.

#pragma once

#include "Tally/FileClassifier.hpp"
#include "Tally/TreeScanner.hpp"
#include <map>
#include <string>
#include <vector>

namespace Tally {

/**
 * @brief Summed counts and ratios for one extension group (or the grand total)
 */
struct ExtensionSummary {
    std::string extension;
    std::string language;
    size_t file_count = 0;
    size_t total_lines = 0;
    size_t code_lines = 0;
    size_t comment_lines = 0;
    size_t blank_lines = 0;
    double code_ratio = 0.0;
    double comment_ratio = 0.0;
    double blank_ratio = 0.0;

    void add(const FileStat& stat);
    void add(const ExtensionSummary& other);

    /**
     * @brief Recompute the ratios from the counts; all are 0.0 when total is 0
     */
    void computeRatios();
};

/**
 * @brief Aggregated statistics of one scan
 */
struct AggregateReport {
    std::map<std::string, ExtensionSummary> groups;   ///< Alphabetical by extension
    ExtensionSummary total;
    std::vector<SkippedFile> skipped;

    size_t skippedCount() const { return skipped.size(); }
};

class Aggregator {
public:
    /**
     * @brief Aggregate the files of a scan and carry over its skip tally
     * @param rules Used to attach a language name to each group
     */
    static AggregateReport aggregate(const ScanResult& result, const LanguageRules& rules);

    static AggregateReport aggregate(const std::vector<FileStat>& files);
};

} // namespace Tally
