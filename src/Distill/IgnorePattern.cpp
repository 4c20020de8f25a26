// =================================================================
// src/Distill/IgnorePattern.cpp
// =================================================================
// Implementation of gitignore-style exclusion rules.

#include "Distill/IgnorePattern.hpp"
#include "Distill/Logger.hpp"
#include <cstring>
#include <fstream>

namespace Distill {

namespace {

const char* const kRegexSpecials = ".^$+{}|()[]\\*?";

void emitLiteral(std::string& regex, char c) {
    if (std::strchr(kRegexSpecials, c) != nullptr) {
        regex += '\\';
    }
    regex += c;
}

// Translates a bracket expression starting at `open`; returns the index of
// the closing bracket, or npos when the bracket is unterminated.
size_t emitBracket(const std::string& glob, size_t open, std::string& regex) {
    size_t body = open + 1;
    bool inverted = body < glob.size() && (glob[body] == '!' || glob[body] == '^');
    if (inverted) {
        ++body;
    }
    // A ']' right after the opening bracket is a member, not the terminator
    size_t search_from = (body < glob.size() && glob[body] == ']') ? body + 1 : body;
    size_t close = glob.find(']', search_from);
    if (close == std::string::npos) {
        return std::string::npos;
    }

    regex += inverted ? "[^" : "[";
    for (size_t k = body; k < close; ++k) {
        char member = glob[k];
        if (member == '\\' || member == '[' || member == ']') {
            regex += '\\';
        }
        regex += member;
    }
    regex += ']';
    return close;
}

std::string translateGlob(const std::string& glob) {
    std::string regex;
    size_t pos = 0;

    while (pos < glob.size()) {
        char c = glob[pos];

        if (c == '*') {
            size_t stars_end = glob.find_first_not_of('*', pos);
            if (stars_end == std::string::npos) {
                stars_end = glob.size();
            }
            bool whole_segment = (stars_end - pos >= 2) &&
                                 (pos == 0 || glob[pos - 1] == '/') &&
                                 (stars_end == glob.size() || glob[stars_end] == '/');
            if (!whole_segment) {
                regex += "[^/]*";
                pos = stars_end;
            } else if (stars_end == glob.size()) {
                regex += ".*";
                pos = stars_end;
            } else {
                // "**/" spans zero or more whole directories
                regex += "(?:.*/)?";
                pos = stars_end + 1;
            }
            continue;
        }

        if (c == '?') {
            regex += "[^/]";
        } else if (c == '[') {
            size_t close = emitBracket(glob, pos, regex);
            if (close == std::string::npos) {
                emitLiteral(regex, c);
            } else {
                pos = close;
            }
        } else if (c == '\\') {
            if (pos + 1 < glob.size()) {
                emitLiteral(regex, glob[++pos]);
            } else {
                regex += "\\\\";
            }
        } else {
            emitLiteral(regex, c);
        }
        ++pos;
    }

    return regex;
}

std::string trimRelative(const std::string& path) {
    size_t begin = 0;
    while (path.compare(begin, 2, "./") == 0) {
        begin += 2;
    }
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos || end < begin) {
        return "";
    }
    return path.substr(begin, end - begin + 1);
}

} // namespace

IgnorePattern::IgnorePattern(const std::string& line)
    : m_source(line)
{
    std::string glob = stripLine(line);
    if (m_inert) {
        return;
    }

    std::string body = translateGlob(glob);
    std::string anchored = m_anchored ? "^" + body + "$" : "^(?:.*/)?" + body + "$";
    try {
        m_matcher = std::regex(anchored, std::regex_constants::ECMAScript | std::regex_constants::optimize);
    } catch (const std::regex_error& e) {
        Logger::getInstance().warning("IgnorePattern", "Ignoring rule that does not compile: " + line, e.what());
        m_inert = true;
    }
}

std::string IgnorePattern::stripLine(const std::string& line) {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    if (text.empty() || text[0] == '#') {
        m_inert = true;
        return "";
    }

    size_t first = text.find_first_not_of(" \t");
    size_t last = text.find_last_not_of(" \t");
    if (first == std::string::npos) {
        m_inert = true;
        return "";
    }
    // "\ " at the end keeps its space
    if (text[last] == '\\' && last + 1 < text.size()) {
        ++last;
    }
    text = text.substr(first, last - first + 1);

    if (text[0] == '!') {
        m_negated = true;
        text.erase(0, 1);
    } else if (text.size() > 1 && text[0] == '\\' && (text[1] == '!' || text[1] == '#')) {
        text.erase(0, 1);
    }

    size_t keep = text.find_last_not_of('/');
    if (keep == std::string::npos) {
        m_inert = true;
        return "";
    }
    if (keep + 1 < text.size()) {
        m_dirs_only = true;
        text.erase(keep + 1);
    }

    if (text[0] == '/') {
        text.erase(0, 1);
        m_anchored = true;
    }
    if (text.empty()) {
        m_inert = true;
        return "";
    }
    if (text.find('/') != std::string::npos) {
        m_anchored = true;
    }
    return text;
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_inert || (m_dirs_only && !is_directory)) {
        return false;
    }
    return std::regex_match(path, m_matcher);
}

IgnoreRuleSet IgnoreRuleSet::compile(const std::vector<std::string>& base_rules,
                                     const std::vector<std::string>& supplemental_rules,
                                     bool bypass) {
    IgnoreRuleSet rule_set;
    if (!bypass) {
        rule_set.append(base_rules);
        rule_set.append(supplemental_rules);
    }
    return rule_set;
}

std::vector<std::string> IgnoreRuleSet::loadRuleFile(const std::string& file_path) {
    std::vector<std::string> lines;
    std::ifstream in(file_path);
    for (std::string line; in && std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

void IgnoreRuleSet::append(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        IgnorePattern rule(line);
        if (!rule.isEmpty()) {
            m_rules.push_back(std::move(rule));
        }
    }
}

bool IgnoreRuleSet::matches(const std::string& path, bool is_directory) const {
    std::string relative = trimRelative(path);
    if (m_rules.empty() || relative.empty()) {
        return false;
    }

    // Once a directory is out, nothing beneath it can come back
    for (size_t slash = relative.find('/'); slash != std::string::npos; slash = relative.find('/', slash + 1)) {
        if (matchesEntry(relative.substr(0, slash), true)) {
            return true;
        }
    }
    return matchesEntry(relative, is_directory);
}

bool IgnoreRuleSet::matchesEntry(const std::string& path, bool is_directory) const {
    for (auto rule = m_rules.rbegin(); rule != m_rules.rend(); ++rule) {
        if (rule->matches(path, is_directory)) {
            return !rule->isNegation();
        }
    }
    return false;
}

} // namespace Distill
