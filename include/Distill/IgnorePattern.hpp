// =================================================================
// include/Distill/IgnorePattern.hpp
// =================================================================
// Gitignore-style exclusion rules used to prune the directory walk.

#pragma once

#include <regex>
#include <string>
#include <vector>

namespace Distill {

/**
 * @brief One compiled line of gitignore syntax
 *
 * Understands `*`, `**`, `?`, bracket classes, a leading `!` for
 * re-inclusion, a trailing `/` for directories, and anchoring by a
 * leading or interior `/`. Blank lines and `#` comments compile to an
 * inert rule for which isEmpty() is true.
 */
class IgnorePattern {
public:
    explicit IgnorePattern(const std::string& line);

    /**
     * @brief Test a root-relative path with forward slashes
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_negated; }
    bool isDirectoryOnly() const { return m_dirs_only; }
    bool isAnchored() const { return m_anchored; }
    bool isEmpty() const { return m_inert; }
    const std::string& getPattern() const { return m_source; }

private:
    std::string m_source;
    bool m_negated = false;
    bool m_dirs_only = false;
    bool m_anchored = false;
    bool m_inert = false;
    std::regex m_matcher;

    std::string stripLine(const std::string& line);
};

/**
 * @brief The ordered rule list applied to one run
 *
 * The last rule matching a path decides: plain rules exclude, negated
 * ones re-include. Unmatched paths are kept. A rule set is built once
 * per run and only read afterwards, so walkers may share it.
 */
class IgnoreRuleSet {
public:
    IgnoreRuleSet() = default;

    /**
     * @brief Build the rule list for a run
     * @param base_rules Built-in defaults followed by configured patterns
     * @param supplemental_rules Lines read from the project's ignore file
     * @param bypass Produce an empty set that keeps everything
     */
    static IgnoreRuleSet compile(const std::vector<std::string>& base_rules,
                                 const std::vector<std::string>& supplemental_rules,
                                 bool bypass = false);

    /// Lines of an ignore file, or nothing when it cannot be opened.
    static std::vector<std::string> loadRuleFile(const std::string& file_path);

    /**
     * @brief Full check, where an excluded ancestor directory excludes the path
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check only the entry itself
     *
     * The walker prunes excluded directories before descending, so by the
     * time it asks about an entry every ancestor is already known to pass.
     */
    bool matchesEntry(const std::string& path, bool is_directory) const;

    size_t size() const { return m_rules.size(); }
    bool empty() const { return m_rules.empty(); }

private:
    std::vector<IgnorePattern> m_rules;

    void append(const std::vector<std::string>& lines);
};

} // namespace Distill
