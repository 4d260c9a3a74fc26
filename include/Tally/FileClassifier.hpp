// =================================================================
// include/Tally/FileClassifier.hpp
// =================================================================
// Line classification into code, comment and blank lines.

#pragma once

#include "Tally/LanguageRules.hpp"
#include <cstddef>
#include <string>

namespace Tally {

/**
 * @brief Category a single line is counted in
 */
enum class LineKind {
    Blank,
    Comment,
    Code
};

/**
 * @brief Line counts for one file
 *
 * Every line is counted in exactly one category, so
 * code_lines + comment_lines + blank_lines == total_lines.
 */
struct FileStat {
    std::string path;
    std::string extension;
    size_t total_lines = 0;
    size_t code_lines = 0;
    size_t comment_lines = 0;
    size_t blank_lines = 0;

    void add(LineKind kind);
    bool isConsistent() const {
        return code_lines + comment_lines + blank_lines == total_lines;
    }
};

/**
 * @brief Two-state automaton tracking block comments across lines
 *
 * States are Normal and InBlockComment. While inside a block comment the
 * classifier remembers the close marker of the pair that opened it. Nested
 * block comments are not supported, and at most one state transition happens
 * per line.
 */
class LineClassifier {
public:
    enum class State {
        Normal,
        InBlockComment
    };

    explicit LineClassifier(const LanguageRule& rule);

    /**
     * @brief Classify the next line of the file and advance the state
     * @param line Line content without its line terminator
     */
    LineKind classify(const std::string& line);

    State state() const { return m_state; }
    void reset();

private:
    LineKind classifyNormal(const std::string& stripped);

    LanguageRule m_rule;
    State m_state = State::Normal;
    std::string m_active_close;
};

/**
 * @brief Produces per-file line counts from file content
 */
class FileClassifier {
public:
    /**
     * @brief Classify text that is already in memory
     * @param text Full file content
     * @param rule Comment syntax to apply
     * @param path Path recorded in the result
     * @return Counts for the text
     */
    static FileStat classifyText(const std::string& text,
                                 const LanguageRule& rule,
                                 const std::string& path = "");

    /**
     * @brief Read a file and classify its lines
     * @throws ReadError if the file cannot be read, is binary, or is not UTF-8
     */
    static FileStat classifyFile(const std::string& path, const LanguageRule& rule);

    /**
     * @brief Read a whole file as UTF-8 text
     * @throws ReadError on I/O failure, NUL bytes, or invalid UTF-8
     */
    static std::string readText(const std::string& path);

    /**
     * @brief Check that a byte sequence is well-formed UTF-8
     */
    static bool isValidUtf8(const std::string& bytes);
};

} // namespace Tally
