// =================================================================
// src/Tally/Translator.cpp
// =================================================================
// Report string tables for en, chs, cht and ja.

#include "Tally/Translator.hpp"
#include <map>

namespace Tally {

namespace {

using StringTable = std::map<std::string, std::string>;

const StringTable& tableFor(ReportLanguage language) {
    static const StringTable chs = {
        {"Code Line Counter", "代码行数统计工具"},
        {"Total", "总计"},
        {"Files", "文件数量"},
        {"Total Lines", "总行数"},
        {"Code Lines", "代码行"},
        {"Comment Lines", "注释行"},
        {"Blank Lines", "空行"},
        {"Code Line Ratio", "代码行占比"},
        {"Comment Line Ratio", "注释行占比"},
        {"Blank Line Ratio", "空行占比"},
        {"Failed to read file", "读取文件失败"},
        {"Code Line Statistics Results", "代码行数统计结果"},
        {"File Count", "文件数量"},
        {"Skipped Files", "跳过的文件"},
        {"Extension", "扩展名"},
    };
    static const StringTable cht = {
        {"Code Line Counter", "程式碼行數統計工具"},
        {"Total", "總計"},
        {"Files", "檔案數量"},
        {"Total Lines", "總行數"},
        {"Code Lines", "程式碼行"},
        {"Comment Lines", "註解行"},
        {"Blank Lines", "空白行"},
        {"Code Line Ratio", "程式碼行佔比"},
        {"Comment Line Ratio", "註解行佔比"},
        {"Blank Line Ratio", "空白行佔比"},
        {"Failed to read file", "讀取檔案失敗"},
        {"Code Line Statistics Results", "程式碼行數統計結果"},
        {"File Count", "檔案數量"},
        {"Skipped Files", "略過的檔案"},
        {"Extension", "副檔名"},
    };
    static const StringTable ja = {
        {"Code Line Counter", "コード行数カウンター"},
        {"Total", "合計"},
        {"Files", "ファイル数"},
        {"Total Lines", "総行数"},
        {"Code Lines", "コード行"},
        {"Comment Lines", "コメント行"},
        {"Blank Lines", "空白行"},
        {"Code Line Ratio", "コード行の割合"},
        {"Comment Line Ratio", "コメント行の割合"},
        {"Blank Line Ratio", "空白行の割合"},
        {"Failed to read file", "ファイルの読み取りに失敗しました"},
        {"Code Line Statistics Results", "コード行数統計結果"},
        {"File Count", "ファイル数"},
        {"Skipped Files", "スキップされたファイル"},
        {"Extension", "拡張子"},
    };
    // English strings are the keys themselves.
    static const StringTable en;

    switch (language) {
        case ReportLanguage::Chs: return chs;
        case ReportLanguage::Cht: return cht;
        case ReportLanguage::Ja: return ja;
        case ReportLanguage::En:
        default: return en;
    }
}

} // namespace

Translator::Translator(ReportLanguage language)
    : m_language(language) {}

std::string Translator::tr(const std::string& key) const {
    return translate(key, m_language);
}

std::string Translator::translate(const std::string& key, ReportLanguage language) {
    const StringTable& table = tableFor(language);
    auto it = table.find(key);
    if (it != table.end()) {
        return it->second;
    }
    return key;
}

std::optional<ReportLanguage> Translator::parseLanguage(const std::string& code) {
    if (code == "en") return ReportLanguage::En;
    if (code == "chs") return ReportLanguage::Chs;
    if (code == "cht") return ReportLanguage::Cht;
    if (code == "ja") return ReportLanguage::Ja;
    return std::nullopt;
}

std::string Translator::languageCode(ReportLanguage language) {
    switch (language) {
        case ReportLanguage::Chs: return "chs";
        case ReportLanguage::Cht: return "cht";
        case ReportLanguage::Ja: return "ja";
        case ReportLanguage::En:
        default: return "en";
    }
}

std::vector<std::string> Translator::supportedCodes() {
    return {"en", "chs", "cht", "ja"};
}

} // namespace Tally
