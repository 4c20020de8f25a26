// =================================================================
// include/Distill/LanguageClassifier.hpp
// =================================================================
// Header for mapping files to programming language labels.

#pragma once

#include <string>
#include <vector>
#include <regex>
#include <unordered_map>

namespace Distill {

/**
 * @brief Weighted regular expression voting for one language
 */
struct LanguageIndicator {
    std::string language;
    std::regex pattern;
    int weight;
};

/**
 * @brief Classifies files into language labels such as "C++" or "Python"
 *
 * Special filenames and extensions are consulted first. Files that are
 * still unknown get a bounded content sniff: shebang line, JSON validity,
 * markup markers and weighted indicator patterns. The fallback label is
 * "Text"; classification never fails.
 */
class LanguageClassifier {
public:
    LanguageClassifier();

    /**
     * @brief Classify a file
     * @param relative_path Path used for filename and extension lookup
     * @param sample Leading decoded content; only the first sniff_limit bytes are read
     * @return Language label
     */
    std::string classify(const std::string& relative_path, const std::string& sample) const;

    /**
     * @brief Look up a label by filename and extension only
     * @return Label, or empty string when the name says nothing
     */
    std::string classifyByName(const std::string& relative_path) const;

    /**
     * @brief Guess a label from content alone
     * @return Label, or empty string when nothing matched
     */
    std::string classifyByContent(const std::string& sample) const;

    /**
     * @brief Markdown code fence tag for a label ("C++" -> "cpp")
     */
    static std::string fenceTag(const std::string& language);

    static constexpr size_t kSniffLimit = 4096;

private:
    std::unordered_map<std::string, std::string> m_extension_map;
    std::unordered_map<std::string, std::string> m_filename_map;
    std::unordered_map<std::string, std::string> m_interpreter_map;
    std::vector<LanguageIndicator> m_indicators;

    void initializeExtensionMap();
    void initializeFilenameMap();
    void initializeInterpreterMap();
    void initializeIndicators();

    std::string classifyByShebang(const std::string& sample) const;
};

} // namespace Distill
