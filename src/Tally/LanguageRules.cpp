// =================================================================
// src/Tally/LanguageRules.cpp
// =================================================================
// Built-in comment syntax table and YAML rules loading.

#include "Tally/LanguageRules.hpp"
#include "Tally/Errors.hpp"
#include "Tally/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace Tally {

namespace {

const std::pair<std::string, std::string> kCBlock{"/*", "*/"};

LanguageRule makeRule(const std::string& language,
                      std::vector<std::string> extensions,
                      std::vector<std::string> line_markers,
                      std::vector<std::pair<std::string, std::string>> block_pairs = {}) {
    LanguageRule rule;
    rule.language = language;
    rule.extensions = std::move(extensions);
    rule.line_comment_markers = std::move(line_markers);
    rule.block_comment_pairs = std::move(block_pairs);
    return rule;
}

// Accepts either a single string or a sequence of strings.
std::vector<std::string> readStringList(const YAML::Node& node) {
    std::vector<std::string> values;
    if (!node) {
        return values;
    }
    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
        return values;
    }
    if (!node.IsSequence()) {
        throw ConfigError("expected a string or a list of strings");
    }
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

std::vector<std::pair<std::string, std::string>> readBlockPairs(const YAML::Node& node) {
    std::vector<std::pair<std::string, std::string>> pairs;
    if (!node) {
        return pairs;
    }
    if (!node.IsSequence()) {
        throw ConfigError("block_comment must be a list of [open, close] pairs");
    }
    // A bare ["/*", "*/"] is accepted as a single pair.
    if (node.size() == 2 && node[0].IsScalar() && node[1].IsScalar()) {
        pairs.emplace_back(node[0].as<std::string>(), node[1].as<std::string>());
        return pairs;
    }
    for (const auto& item : node) {
        if (!item.IsSequence() || item.size() != 2) {
            throw ConfigError("block_comment entries must have exactly two markers");
        }
        pairs.emplace_back(item[0].as<std::string>(), item[1].as<std::string>());
    }
    return pairs;
}

} // namespace

LanguageRules::LanguageRules() {
    for (auto& rule : defaults()) {
        addRule(std::move(rule));
    }
}

std::optional<LanguageRule> LanguageRules::lookup(const std::string& extension) const {
    auto it = m_by_extension.find(normalizeExtension(extension));
    if (it == m_by_extension.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LanguageRules::isKnown(const std::string& extension) const {
    return m_by_extension.count(normalizeExtension(extension)) > 0;
}

void LanguageRules::addRule(LanguageRule rule) {
    for (auto& ext : rule.extensions) {
        ext = normalizeExtension(ext);
    }
    for (const auto& ext : rule.extensions) {
        if (ext.size() < 2) {
            continue;
        }
        m_by_extension[ext] = rule;
    }
}

size_t LanguageRules::loadFromFile(const std::string& path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw ConfigError("Rules file not found: " + path);
    }

    size_t loaded = 0;
    try {
        YAML::Node root = YAML::LoadFile(path);
        YAML::Node languages = root["languages"];
        if (!languages || !languages.IsMap()) {
            throw ConfigError("missing 'languages' map");
        }

        for (YAML::const_iterator it = languages.begin(); it != languages.end(); ++it) {
            LanguageRule rule;
            rule.language = it->first.as<std::string>();

            YAML::Node node = it->second;
            rule.extensions = readStringList(node["extensions"]);
            if (rule.extensions.empty()) {
                throw ConfigError("Language '" + rule.language + "' has no extensions");
            }
            rule.line_comment_markers = readStringList(node["line_comment"]);
            rule.block_comment_pairs = readBlockPairs(node["block_comment"]);

            LOG_DEBUG("LanguageRules", "Loaded rule for " + rule.language);
            addRule(std::move(rule));
            ++loaded;
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid rules file " + path + ": " + e.what());
    } catch (const ConfigError& e) {
        throw ConfigError("Invalid rules file " + path + ": " + e.what());
    }

    Logger::getInstance().info("LanguageRules", "Loaded language rules",
                               std::to_string(loaded) + " languages from " + path);
    return loaded;
}

std::string LanguageRules::normalizeExtension(const std::string& extension) {
    std::string normalized = extension;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (normalized.empty() || normalized[0] != '.') {
        normalized.insert(normalized.begin(), '.');
    }
    return normalized;
}

LanguageRule LanguageRules::plainText(const std::string& extension) {
    return makeRule("Text", {normalizeExtension(extension)}, {});
}

std::vector<LanguageRule> LanguageRules::defaults() {
    return {
        makeRule("C", {".c"}, {"//"}, {kCBlock}),
        makeRule("C++", {".cpp", ".cc", ".cxx", ".h", ".hpp", ".hh", ".hxx", ".ipp", ".inl"},
                 {"//"}, {kCBlock}),
        makeRule("Objective-C", {".m", ".mm"}, {"//"}, {kCBlock}),
        makeRule("C#", {".cs"}, {"//"}, {kCBlock}),
        makeRule("Java", {".java"}, {"//"}, {kCBlock}),
        makeRule("Kotlin", {".kt", ".kts"}, {"//"}, {kCBlock}),
        makeRule("Scala", {".scala"}, {"//"}, {kCBlock}),
        makeRule("Go", {".go"}, {"//"}, {kCBlock}),
        makeRule("Rust", {".rs"}, {"//"}, {kCBlock}),
        makeRule("Swift", {".swift"}, {"//"}, {kCBlock}),
        makeRule("Dart", {".dart"}, {"//"}, {kCBlock}),
        makeRule("JavaScript", {".js", ".jsx", ".mjs", ".cjs"}, {"//"}, {kCBlock}),
        makeRule("TypeScript", {".ts", ".tsx"}, {"//"}, {kCBlock}),
        makeRule("PHP", {".php"}, {"//", "#"}, {kCBlock}),
        makeRule("CSS", {".css", ".scss", ".less"}, {}, {kCBlock}),
        makeRule("Python", {".py", ".pyi", ".pyw"}, {"#"}, {{"\"\"\"", "\"\"\""}, {"'''", "'''"}}),
        makeRule("Ruby", {".rb"}, {"#"}, {{"=begin", "=end"}}),
        makeRule("Shell", {".sh", ".bash", ".zsh"}, {"#"}),
        makeRule("Perl", {".pl", ".pm"}, {"#"}),
        makeRule("R", {".r"}, {"#"}),
        makeRule("YAML", {".yml", ".yaml"}, {"#"}),
        makeRule("TOML", {".toml"}, {"#"}),
        makeRule("CMake", {".cmake"}, {"#"}, {{"#[[", "]]"}}),
        makeRule("Makefile", {".mk", ".make"}, {"#"}),
        makeRule("SQL", {".sql"}, {"--"}, {kCBlock}),
        makeRule("Lua", {".lua"}, {"--"}, {{"--[[", "]]"}}),
        makeRule("Haskell", {".hs"}, {"--"}, {{"{-", "-}"}}),
        makeRule("HTML", {".html", ".htm", ".vue"}, {}, {{"<!--", "-->"}}),
        makeRule("XML", {".xml", ".xsd", ".svg"}, {}, {{"<!--", "-->"}}),
    };
}

} // namespace Tally
