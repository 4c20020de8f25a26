// =================================================================
// src/Distill/ContentSanitizer.cpp
// =================================================================
// Implementation for language-aware cleanup of decoded file content.

#include "Distill/ContentSanitizer.hpp"
#include <algorithm>

namespace Distill {

static size_t findStringEnd(const std::string& text, size_t pos, const StringDelimiter& string_delimiter) {
    const size_t length = text.size();
    const std::string& close = string_delimiter.delimiter;

    while (pos < length) {
        char c = text[pos];
        if (c == '\\' && string_delimiter.escapes) {
            pos = std::min(pos + 2, length);
            continue;
        }
        if (text.compare(pos, close.size(), close) == 0) {
            return pos + close.size();
        }
        // Unterminated single-line literal ends with its line
        if (c == '\n' && !string_delimiter.multiline) {
            return pos;
        }
        ++pos;
    }
    return length;
}

ContentSanitizer::ContentSanitizer(SanitizeOptions options)
    : m_options(options) {
    initializeDefaultRules();
}

std::string ContentSanitizer::sanitize(const std::string& language, const std::string& text) const {
    std::string result = normalizeLineEndings(text);
    result = removeInvisibleCharacters(result);

    if (m_options.strip_comments) {
        const CommentRule& rule = ruleFor(language);
        if (!rule.empty()) {
            // Lex the same text a second pass would see; trailing blanks
            // after a backslash change where a literal ends.
            result = stripComments(normalizeWhitespace(result), rule);
        }
    }

    return normalizeWhitespace(result);
}

const CommentRule& ContentSanitizer::ruleFor(const std::string& language) const {
    static const CommentRule no_rule;
    auto it = m_rules.find(language);
    return it != m_rules.end() ? it->second : no_rule;
}

void ContentSanitizer::registerRule(const std::string& language, CommentRule rule) {
    m_rules[language] = std::move(rule);
}

std::string ContentSanitizer::normalizeLineEndings(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            result += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            result += text[i];
        }
    }
    return result;
}

std::string ContentSanitizer::removeInvisibleCharacters(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    const size_t length = text.size();
    for (size_t i = 0; i < length; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        // U+200B..U+200D, U+2060 and U+FEFF
        if (c == 0xE2 && i + 2 < length) {
            unsigned char b1 = static_cast<unsigned char>(text[i + 1]);
            unsigned char b2 = static_cast<unsigned char>(text[i + 2]);
            if ((b1 == 0x80 && b2 >= 0x8B && b2 <= 0x8D) || (b1 == 0x81 && b2 == 0xA0)) {
                i += 2;
                continue;
            }
        }
        if (c == 0xEF && i + 2 < length &&
            static_cast<unsigned char>(text[i + 1]) == 0xBB &&
            static_cast<unsigned char>(text[i + 2]) == 0xBF) {
            i += 2;
            continue;
        }

        if ((c < 0x20 && c != '\t' && c != '\n') || c == 0x7F) {
            result += ' ';
        } else {
            result += static_cast<char>(c);
        }
    }
    return result;
}

std::string ContentSanitizer::stripComments(const std::string& text, const CommentRule& rule) const {
    std::string result;
    result.reserve(text.size());

    const size_t length = text.size();
    size_t i = 0;

    // Keep a shebang line even where # starts a comment
    if (text.compare(0, 2, "#!") == 0) {
        size_t newline = text.find('\n');
        i = newline == std::string::npos ? length : newline;
        result.append(text, 0, i);
    }

    while (i < length) {
        bool consumed = false;

        for (const auto& block : rule.block_delimiters) {
            if (text.compare(i, block.first.size(), block.first) == 0) {
                size_t close = text.find(block.second, i + block.first.size());
                i = close == std::string::npos ? length : close + block.second.size();
                result += ' ';
                consumed = true;
                break;
            }
        }
        if (consumed) {
            continue;
        }

        for (const auto& marker : rule.line_markers) {
            if (text.compare(i, marker.size(), marker) != 0) {
                continue;
            }
            if (rule.marker_needs_boundary && i > 0 && text[i - 1] != ' ' && text[i - 1] != '\t' && text[i - 1] != '\n') {
                continue;
            }
            size_t newline = text.find('\n', i);
            i = newline == std::string::npos ? length : newline;
            consumed = true;
            break;
        }
        if (consumed) {
            continue;
        }

        for (const auto& string_delimiter : rule.string_delimiters) {
            if (text.compare(i, string_delimiter.delimiter.size(), string_delimiter.delimiter) == 0) {
                size_t end = findStringEnd(text, i + string_delimiter.delimiter.size(), string_delimiter);
                result.append(text, i, end - i);
                i = end;
                consumed = true;
                break;
            }
        }
        if (consumed) {
            continue;
        }

        result += text[i];
        ++i;
    }

    return result;
}

std::string ContentSanitizer::normalizeWhitespace(const std::string& text) const {
    std::string result;
    result.reserve(text.size() + 1);

    size_t pending_blank_lines = 0;
    bool seen_content = false;
    size_t pos = 0;

    while (pos <= text.size()) {
        size_t newline = text.find('\n', pos);
        size_t line_end = newline == std::string::npos ? text.size() : newline;

        size_t last = text.find_last_not_of(" \t", line_end == 0 ? std::string::npos : line_end - 1);
        bool blank = (last == std::string::npos || last < pos);

        if (blank) {
            if (seen_content) {
                ++pending_blank_lines;
            }
        } else {
            size_t keep = std::min(pending_blank_lines, m_options.max_consecutive_blank_lines);
            result.append(keep, '\n');
            pending_blank_lines = 0;
            result.append(text, pos, last + 1 - pos);
            result += '\n';
            seen_content = true;
        }

        if (newline == std::string::npos) {
            break;
        }
        pos = newline + 1;
    }

    return result;
}

void ContentSanitizer::initializeDefaultRules() {
    const StringDelimiter double_quote{"\"", false, true};
    const StringDelimiter single_quote{"'", false, true};
    const StringDelimiter backtick{"`", true, true};
    const std::pair<std::string, std::string> c_block{"/*", "*/"};

    CommentRule c_family;
    c_family.line_markers = {"//"};
    c_family.block_delimiters = {c_block};
    c_family.string_delimiters = {double_quote, single_quote};
    for (const char* language : {"C", "C++", "Objective-C", "C#", "Java", "Kotlin", "Scala",
                                 "Swift", "Dart", "PHP", "Protocol Buffers", "Zig"}) {
        m_rules[language] = c_family;
    }
    m_rules["PHP"].line_markers.push_back("#");

    // Lifetimes make ' unusable as a literal delimiter
    CommentRule rust;
    rust.line_markers = {"//"};
    rust.block_delimiters = {c_block};
    rust.string_delimiters = {double_quote};
    m_rules["Rust"] = rust;

    CommentRule go = c_family;
    go.string_delimiters.push_back({"`", true, false});
    m_rules["Go"] = go;

    CommentRule script = c_family;
    script.string_delimiters.push_back(backtick);
    for (const char* language : {"JavaScript", "TypeScript", "Vue", "Svelte"}) {
        m_rules[language] = script;
    }

    CommentRule python;
    python.line_markers = {"#"};
    python.string_delimiters = {{"\"\"\"", true, true}, {"'''", true, true}, double_quote, single_quote};
    m_rules["Python"] = python;

    CommentRule hash;
    hash.line_markers = {"#"};
    hash.string_delimiters = {double_quote, {"'", false, false}};
    hash.marker_needs_boundary = true;
    for (const char* language : {"Shell", "YAML", "TOML", "Makefile", "Dockerfile", "CMake",
                                 "Perl", "Ruby", "R", "Julia", "Elixir", "PowerShell"}) {
        m_rules[language] = hash;
    }

    CommentRule ini;
    ini.line_markers = {";", "#"};
    ini.marker_needs_boundary = true;
    m_rules["INI"] = ini;

    CommentRule sql;
    sql.line_markers = {"--"};
    sql.block_delimiters = {c_block};
    sql.string_delimiters = {{"'", false, false}, {"\"", false, false}};
    m_rules["SQL"] = sql;

    CommentRule lua;
    lua.line_markers = {"--"};
    lua.block_delimiters = {{"--[[", "]]"}};
    lua.string_delimiters = {double_quote, single_quote};
    m_rules["Lua"] = lua;

    CommentRule haskell;
    haskell.line_markers = {"--"};
    haskell.block_delimiters = {{"{-", "-}"}};
    haskell.string_delimiters = {double_quote};
    m_rules["Haskell"] = haskell;

    CommentRule erlang;
    erlang.line_markers = {"%"};
    erlang.string_delimiters = {double_quote};
    m_rules["Erlang"] = erlang;

    CommentRule style;
    style.block_delimiters = {c_block};
    style.string_delimiters = {double_quote, single_quote};
    m_rules["CSS"] = style;
    m_rules["SCSS"] = style;
    m_rules["Less"] = style;
    m_rules["SCSS"].line_markers = {"//"};
    m_rules["Less"].line_markers = {"//"};

    CommentRule markup;
    markup.block_delimiters = {{"<!--", "-->"}};
    for (const char* language : {"HTML", "XML", "Markdown"}) {
        m_rules[language] = markup;
    }
}

} // namespace Distill
