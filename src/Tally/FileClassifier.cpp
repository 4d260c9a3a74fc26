// =================================================================
// src/Tally/FileClassifier.cpp
// =================================================================
// Implementation of the line classifier and file reading.

#include "Tally/FileClassifier.hpp"
#include "Tally/Errors.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Tally {

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

std::string trim(const std::string& s) {
    size_t first = 0;
    while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first]))) {
        ++first;
    }
    size_t last = s.size();
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) {
        --last;
    }
    return s.substr(first, last - first);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return !prefix.empty() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

void FileStat::add(LineKind kind) {
    ++total_lines;
    switch (kind) {
        case LineKind::Blank: ++blank_lines; break;
        case LineKind::Comment: ++comment_lines; break;
        case LineKind::Code: ++code_lines; break;
    }
}

LineClassifier::LineClassifier(const LanguageRule& rule)
    : m_rule(rule) {}

void LineClassifier::reset() {
    m_state = State::Normal;
    m_active_close.clear();
}

LineKind LineClassifier::classify(const std::string& line) {
    if (m_state == State::InBlockComment) {
        // Anything after the close marker is not looked at again.
        if (line.find(m_active_close) != std::string::npos) {
            reset();
        }
        return LineKind::Comment;
    }

    const std::string stripped = trim(line);
    if (stripped.empty()) {
        return LineKind::Blank;
    }
    return classifyNormal(stripped);
}

LineKind LineClassifier::classifyNormal(const std::string& stripped) {
    // The longest matching marker wins, so "--[[" opens a Lua block rather
    // than reading as a "--" line comment.
    size_t line_marker_len = 0;
    for (const auto& marker : m_rule.line_comment_markers) {
        if (startsWith(stripped, marker) && marker.size() > line_marker_len) {
            line_marker_len = marker.size();
        }
    }

    const std::pair<std::string, std::string>* opened = nullptr;
    for (const auto& pair : m_rule.block_comment_pairs) {
        if (startsWith(stripped, pair.first) && !pair.second.empty()) {
            opened = &pair;
            break;
        }
    }

    if (opened != nullptr && opened->first.size() > line_marker_len) {
        if (stripped.find(opened->second, opened->first.size()) == std::string::npos) {
            m_state = State::InBlockComment;
            m_active_close = opened->second;
        }
        return LineKind::Comment;
    }

    if (line_marker_len > 0) {
        return LineKind::Comment;
    }
    return LineKind::Code;
}

FileStat FileClassifier::classifyText(const std::string& text,
                                      const LanguageRule& rule,
                                      const std::string& path) {
    FileStat stat;
    stat.path = path;
    const std::string suffix = std::filesystem::path(path).extension().string();
    if (!suffix.empty()) {
        stat.extension = LanguageRules::normalizeExtension(suffix);
    } else if (!rule.extensions.empty()) {
        stat.extension = rule.extensions.front();
    }

    LineClassifier classifier(rule);

    size_t pos = 0;
    if (text.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
        pos = kUtf8Bom.size();
    }

    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        stat.add(classifier.classify(line));
        pos = end + 1;
    }

    return stat;
}

FileStat FileClassifier::classifyFile(const std::string& path, const LanguageRule& rule) {
    return classifyText(readText(path), rule, path);
}

std::string FileClassifier::readText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ReadError(path, "cannot open file");
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ReadError(path, "I/O error while reading");
    }

    std::string content = buffer.str();
    if (content.find('\0') != std::string::npos) {
        throw ReadError(path, "binary content");
    }
    if (!isValidUtf8(content)) {
        throw ReadError(path, "invalid UTF-8 encoding");
    }
    return content;
}

bool FileClassifier::isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t extra = 0;
        unsigned int code_point = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace Tally
