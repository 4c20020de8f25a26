// =================================================================
// include/Distill/DirectoryWalker.hpp
// =================================================================
// Header for lazy, ignore-aware project tree traversal.

#pragma once

#include "Distill/IgnorePattern.hpp"
#include "Distill/Types.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace Distill {

struct WalkerOptions {
    bool follow_symlinks = false;
    std::vector<std::string> include_extensions;  ///< Empty means every extension
    std::vector<std::string> exclude_extensions;  ///< Applied after include_extensions
    std::vector<std::string> excluded_paths;      ///< Never emitted, e.g. the output document
};

/**
 * @brief Walks a project tree one candidate file at a time
 *
 * Children are visited in sorted name order, so the discovery order is
 * stable across runs. Directories excluded by the rule set are pruned
 * before descent. Every directory is entered at most once by canonical
 * path, which stops symlink cycles. Entries that cannot be read are
 * recorded as discovery errors and the walk continues.
 */
class DirectoryWalker {
public:
    /**
     * @brief Construct a walker positioned before the first file
     * @param root_path Directory to walk
     * @param rules Compiled ignore rules; must outlive the walker
     * @param options Traversal options
     * @throws SetupError if root_path is not a readable directory
     */
    DirectoryWalker(const std::string& root_path, const IgnoreRuleSet& rules, WalkerOptions options = WalkerOptions());

    /**
     * @brief Advance to the next candidate file
     * @param candidate Receives the candidate
     * @return false when the walk is exhausted
     */
    bool next(CandidatePath& candidate);

    /**
     * @brief Restart the walk from the root, clearing discovery errors
     */
    void reset();

    /**
     * @brief Collect candidates from the current position
     * @param limit Maximum number of candidates; 0 collects all
     */
    std::vector<CandidatePath> walk(size_t limit = 0);

    const std::vector<FailureRecord>& discoveryErrors() const { return m_errors; }
    const std::string& getRoot() const { return m_root_path; }

private:
    struct Entry {
        std::filesystem::path path;
        std::string name;
    };

    struct Frame {
        std::string relative_path;
        std::vector<Entry> entries;
        size_t index = 0;
    };

    std::string m_root_path;
    const IgnoreRuleSet& m_rules;
    WalkerOptions m_options;
    std::unordered_set<std::string> m_include_extensions;
    std::unordered_set<std::string> m_exclude_extensions;
    std::vector<std::filesystem::path> m_excluded_paths;

    std::vector<Frame> m_stack;
    std::set<std::string> m_visited;
    std::vector<FailureRecord> m_errors;

    bool openDirectory(const std::filesystem::path& directory, const std::string& relative_path);
    bool isAllowedExtension(const std::string& name, const std::filesystem::path& path) const;
    static bool matchesExtension(const std::unordered_set<std::string>& extensions,
                                 const std::string& name, const std::filesystem::path& path);
    bool isExcludedPath(const Entry& entry) const;
    void recordError(const std::string& relative_path, const std::string& reason);
};

} // namespace Distill
