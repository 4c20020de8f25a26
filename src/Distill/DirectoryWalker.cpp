// =================================================================
// src/Distill/DirectoryWalker.cpp
// =================================================================
// Implementation for lazy, ignore-aware project tree traversal.

#include "Distill/DirectoryWalker.hpp"
#include "Distill/Errors.hpp"
#include "Distill/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace fs = std::filesystem;

namespace Distill {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

DirectoryWalker::DirectoryWalker(const std::string& root_path, const IgnoreRuleSet& rules, WalkerOptions options)
    : m_rules(rules), m_options(std::move(options))
{
    std::error_code ec;
    fs::path root = fs::canonical(root_path, ec);
    if (ec) {
        throw SetupError("Root directory does not exist: " + root_path + " (" + ec.message() + ")");
    }
    if (!fs::is_directory(root, ec)) {
        throw SetupError("Root path is not a directory: " + root_path);
    }
    m_root_path = root.string();

    auto normalizeExtension = [](const std::string& extension) {
        std::string normalized = toLower(extension);
        if (!normalized.empty() && normalized[0] != '.') {
            normalized = "." + normalized;
        }
        return normalized;
    };
    for (const auto& extension : m_options.include_extensions) {
        m_include_extensions.insert(normalizeExtension(extension));
    }
    for (const auto& extension : m_options.exclude_extensions) {
        m_exclude_extensions.insert(normalizeExtension(extension));
    }

    for (const auto& excluded : m_options.excluded_paths) {
        m_excluded_paths.push_back(fs::weakly_canonical(excluded, ec));
        if (ec) {
            m_excluded_paths.back() = fs::absolute(excluded).lexically_normal();
        }
    }

    reset();
}

void DirectoryWalker::reset() {
    m_stack.clear();
    m_visited.clear();
    m_errors.clear();

    m_visited.insert(m_root_path);
    if (!openDirectory(m_root_path, "")) {
        throw SetupError("Cannot read root directory: " + m_root_path +
                         (m_errors.empty() ? "" : " (" + m_errors.back().reason + ")"));
    }
}

bool DirectoryWalker::next(CandidatePath& candidate) {
    while (!m_stack.empty()) {
        Frame& frame = m_stack.back();
        if (frame.index >= frame.entries.size()) {
            m_stack.pop_back();
            continue;
        }

        // Copy: opening a subdirectory may reallocate the stack
        const Entry entry = frame.entries[frame.index++];
        const std::string relative_path = frame.relative_path.empty()
            ? entry.name : frame.relative_path + "/" + entry.name;

        std::error_code ec;
        fs::file_status link_status = fs::symlink_status(entry.path, ec);
        if (ec) {
            recordError(relative_path, ec.message());
            continue;
        }

        const bool is_symlink = fs::is_symlink(link_status);
        fs::file_status status = link_status;
        if (is_symlink) {
            status = fs::status(entry.path, ec);
            if (ec) {
                if (!m_rules.matchesEntry(relative_path, false)) {
                    recordError(relative_path, "broken symbolic link: " + ec.message());
                }
                continue;
            }
        }

        const bool is_directory = fs::is_directory(status);
        if (m_rules.matchesEntry(relative_path, is_directory)) {
            continue;
        }

        if (is_directory) {
            if (is_symlink && !m_options.follow_symlinks) {
                LOG_DEBUG("DirectoryWalker", "Not following symlinked directory: " + relative_path);
                continue;
            }

            fs::path canonical = fs::canonical(entry.path, ec);
            if (ec) {
                recordError(relative_path, ec.message());
                continue;
            }
            if (!m_visited.insert(canonical.string()).second) {
                LOG_DEBUG("DirectoryWalker", "Directory already visited, skipping: " + relative_path);
                continue;
            }

            openDirectory(entry.path, relative_path);
            continue;
        }

        // Sockets, FIFOs and devices are not source files
        if (!fs::is_regular_file(status)) {
            continue;
        }

        if (!isAllowedExtension(entry.name, entry.path) || isExcludedPath(entry)) {
            continue;
        }

        uintmax_t size = fs::file_size(entry.path, ec);
        if (ec) {
            recordError(relative_path, ec.message());
            continue;
        }

        candidate.absolute_path = entry.path.string();
        candidate.relative_path = relative_path;
        candidate.size_bytes = static_cast<size_t>(size);
        return true;
    }

    return false;
}

std::vector<CandidatePath> DirectoryWalker::walk(size_t limit) {
    std::vector<CandidatePath> candidates;
    CandidatePath candidate;
    while ((limit == 0 || candidates.size() < limit) && next(candidate)) {
        candidates.push_back(candidate);
    }
    return candidates;
}

bool DirectoryWalker::openDirectory(const fs::path& directory, const std::string& relative_path) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        recordError(relative_path.empty() ? "." : relative_path, ec.message());
        return false;
    }

    Frame frame;
    frame.relative_path = relative_path;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        frame.entries.push_back({it->path(), it->path().filename().string()});
    }
    if (ec) {
        recordError(relative_path.empty() ? "." : relative_path, "listing incomplete: " + ec.message());
    }

    std::sort(frame.entries.begin(), frame.entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });

    m_stack.push_back(std::move(frame));
    return true;
}

bool DirectoryWalker::isAllowedExtension(const std::string& name, const fs::path& path) const {
    if (!m_include_extensions.empty() && !matchesExtension(m_include_extensions, name, path)) {
        return false;
    }
    return m_exclude_extensions.empty() || !matchesExtension(m_exclude_extensions, name, path);
}

// Bare names such as "Makefile" count as their own extension
bool DirectoryWalker::matchesExtension(const std::unordered_set<std::string>& extensions,
                                       const std::string& name, const fs::path& path) {
    std::string lower_name = toLower(name);
    return extensions.count(toLower(path.extension().string())) > 0 ||
           extensions.count(lower_name) > 0 ||
           extensions.count("." + lower_name) > 0;
}

bool DirectoryWalker::isExcludedPath(const Entry& entry) const {
    for (const auto& excluded : m_excluded_paths) {
        if (excluded.filename() != entry.path.filename()) {
            continue;
        }
        std::error_code ec;
        fs::path canonical = fs::weakly_canonical(entry.path, ec);
        if (!ec && canonical == excluded) {
            return true;
        }
    }
    return false;
}

void DirectoryWalker::recordError(const std::string& relative_path, const std::string& reason) {
    Logger::getInstance().warning("DirectoryWalker", "Cannot read entry: " + relative_path, reason);
    m_errors.push_back({relative_path, PipelineStage::Discovered, reason});
}

} // namespace Distill
