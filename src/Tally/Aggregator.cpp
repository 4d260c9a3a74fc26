// =================================================================
// src/Tally/Aggregator.cpp
// =================================================================
// Implementation for per-extension aggregation.

#include "Tally/Aggregator.hpp"

namespace Tally {

namespace {

double ratio(size_t part, size_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(whole);
}

} // namespace

void ExtensionSummary::add(const FileStat& stat) {
    file_count += 1;
    total_lines += stat.total_lines;
    code_lines += stat.code_lines;
    comment_lines += stat.comment_lines;
    blank_lines += stat.blank_lines;
}

void ExtensionSummary::add(const ExtensionSummary& other) {
    file_count += other.file_count;
    total_lines += other.total_lines;
    code_lines += other.code_lines;
    comment_lines += other.comment_lines;
    blank_lines += other.blank_lines;
}

void ExtensionSummary::computeRatios() {
    code_ratio = ratio(code_lines, total_lines);
    comment_ratio = ratio(comment_lines, total_lines);
    blank_ratio = ratio(blank_lines, total_lines);
}

AggregateReport Aggregator::aggregate(const std::vector<FileStat>& files) {
    AggregateReport report;
    for (const auto& stat : files) {
        ExtensionSummary& group = report.groups[stat.extension];
        group.extension = stat.extension;
        group.add(stat);
    }

    for (auto& entry : report.groups) {
        entry.second.computeRatios();
        report.total.add(entry.second);
    }
    report.total.computeRatios();
    return report;
}

AggregateReport Aggregator::aggregate(const ScanResult& result, const LanguageRules& rules) {
    AggregateReport report = aggregate(result.files);
    for (auto& [extension, group] : report.groups) {
        auto rule = rules.lookup(extension);
        group.language = rule ? rule->language : "Text";
    }
    report.skipped = result.skipped;
    return report;
}

} // namespace Tally
