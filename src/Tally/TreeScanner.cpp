// =================================================================
// src/Tally/TreeScanner.cpp
// =================================================================
// Implementation for directory traversal and per-file classification.

#include "Tally/TreeScanner.hpp"
#include "Tally/Errors.hpp"
#include "Tally/Logger.hpp"
#include <algorithm>
#include <chrono>

namespace fs = std::filesystem;

namespace Tally {

std::unordered_set<std::string> ScanConfig::defaultExcludedDirs() {
    return {".git", "__pycache__", "node_modules", ".vscode", ".idea"};
}

TreeScanner::TreeScanner(const LanguageRules& rules)
    : m_rules(rules) {}

ScanResult TreeScanner::scan(const ScanConfig& config) const {
    const fs::path root(config.root_path.empty() ? "." : config.root_path);

    std::error_code ec;
    const fs::file_status root_status = fs::status(root, ec);
    if (ec && root_status.type() != fs::file_type::not_found) {
        throw FatalPathError("Cannot access " + root.string() + ": " + ec.message());
    }
    if (!fs::exists(root_status)) {
        throw FatalPathError("Path does not exist: " + root.string());
    }
    if (!fs::is_directory(root_status)) {
        throw FatalPathError("Path is not a directory: " + root.string());
    }

    std::unordered_set<std::string> includes;
    for (const auto& ext : config.include_extensions) {
        includes.insert(LanguageRules::normalizeExtension(ext));
    }

    auto start = std::chrono::steady_clock::now();

    ScanResult result;
    {
        // The root itself must be listable; deeper failures only cost a warning.
        fs::directory_iterator probe(root, ec);
        if (ec) {
            throw FatalPathError("Cannot read directory " + root.string() + ": " + ec.message());
        }
    }
    walkDirectory(root, config, includes, result);

    std::sort(result.files.begin(), result.files.end(),
              [](const FileStat& a, const FileStat& b) { return a.path < b.path; });
    std::sort(result.skipped.begin(), result.skipped.end(),
              [](const SkippedFile& a, const SkippedFile& b) { return a.path < b.path; });

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Logger::getInstance().logScanSummary(root.string(), result.files.size(),
                                         result.skipped.size(), duration.count());
    return result;
}

std::string TreeScanner::extensionOf(const fs::path& path) {
    const std::string ext = path.extension().string();
    if (ext.size() < 2) {
        return "";
    }
    return LanguageRules::normalizeExtension(ext);
}

void TreeScanner::walkDirectory(const fs::path& dir,
                                const ScanConfig& config,
                                const std::unordered_set<std::string>& includes,
                                ScanResult& result) const {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        // Entries listed before the failure are still visited.
        Logger::getInstance().warning("TreeScanner",
                                      entries.empty() ? "Cannot read directory, skipping it"
                                                      : "Directory listing stopped early",
                                      dir.string() + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path() < b.path();
              });

    for (const auto& entry : entries) {
        std::error_code status_ec;
        const bool is_symlink = entry.is_symlink(status_ec);

        if (entry.is_directory(status_ec)) {
            const std::string name = entry.path().filename().string();
            if (is_symlink) {
                LOG_DEBUG("TreeScanner", "Not following symlinked directory: " + entry.path().string());
                continue;
            }
            if (config.exclude_dir_names.count(name) > 0) {
                LOG_DEBUG("TreeScanner", "Pruning excluded directory: " + entry.path().string());
                continue;
            }
            walkDirectory(entry.path(), config, includes, result);
            continue;
        }

        if (entry.is_regular_file(status_ec)) {
            visitFile(entry.path(), config, includes, result);
        }
    }
}

void TreeScanner::visitFile(const fs::path& file,
                            const ScanConfig& config,
                            const std::unordered_set<std::string>& includes,
                            ScanResult& result) const {
    const std::string extension = extensionOf(file);
    if (extension.empty()) {
        return;
    }

    const std::optional<LanguageRule> rule = ruleFor(extension, config, includes);
    if (!rule) {
        return;
    }

    try {
        FileStat stat = FileClassifier::classifyFile(file.string(), *rule);
        stat.extension = extension;
        result.files.push_back(std::move(stat));
    } catch (const ReadError& e) {
        Logger::getInstance().warning("TreeScanner", "Skipping unreadable file", e.what());
        result.skipped.push_back({e.path(), e.reason()});
    }
}

std::optional<LanguageRule> TreeScanner::ruleFor(const std::string& extension,
                                                 const ScanConfig& config,
                                                 const std::unordered_set<std::string>& includes) const {
    if (!includes.empty() && includes.count(extension) == 0) {
        return std::nullopt;
    }

    std::optional<LanguageRule> rule = m_rules.lookup(extension);
    if (rule) {
        return rule;
    }

    // Unknown extensions only count when the user asked for them.
    if (!includes.empty() || config.count_unknown_as_text) {
        return LanguageRules::plainText(extension);
    }
    return std::nullopt;
}

} // namespace Tally
