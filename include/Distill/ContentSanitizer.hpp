// =================================================================
// include/Distill/ContentSanitizer.hpp
// =================================================================
// Header for language-aware cleanup of decoded file content.

#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <utility>

namespace Distill {

/**
 * @brief String literal syntax, so comment markers inside literals are left alone
 */
struct StringDelimiter {
    std::string delimiter;
    bool multiline = false;
    bool escapes = true;
};

/**
 * @brief Comment syntax of one language
 */
struct CommentRule {
    std::vector<std::string> line_markers;
    std::vector<std::pair<std::string, std::string>> block_delimiters;
    std::vector<StringDelimiter> string_delimiters;
    bool marker_needs_boundary = false;  ///< Line marker only counts at line start or after whitespace

    bool empty() const { return line_markers.empty() && block_delimiters.empty(); }
};

struct SanitizeOptions {
    bool strip_comments = false;
    size_t max_consecutive_blank_lines = 1;
};

/**
 * @brief Normalizes decoded text before it is counted and emitted
 *
 * The result uses \n line endings, has no zero-width or stray control
 * characters, no trailing whitespace, at most max_consecutive_blank_lines
 * blank lines in a row, no leading blank lines and exactly one final
 * newline (or is empty). Comments are removed only when strip_comments is
 * set and the language has a registered rule. sanitize() is idempotent.
 */
class ContentSanitizer {
public:
    explicit ContentSanitizer(SanitizeOptions options = SanitizeOptions());

    /**
     * @brief Clean one file's text
     * @param language Label from LanguageClassifier
     * @param text Decoded UTF-8 text
     * @return Cleaned text
     */
    std::string sanitize(const std::string& language, const std::string& text) const;

    /**
     * @brief Comment rule for a language; empty rule when none is registered
     */
    const CommentRule& ruleFor(const std::string& language) const;

    /**
     * @brief Register or replace the comment rule of a language
     */
    void registerRule(const std::string& language, CommentRule rule);

    static std::string normalizeLineEndings(const std::string& text);
    static std::string removeInvisibleCharacters(const std::string& text);
    std::string stripComments(const std::string& text, const CommentRule& rule) const;
    std::string normalizeWhitespace(const std::string& text) const;

    const SanitizeOptions& getOptions() const { return m_options; }

private:
    SanitizeOptions m_options;
    std::unordered_map<std::string, CommentRule> m_rules;

    void initializeDefaultRules();
};

} // namespace Distill
