// =================================================================
// src/Distill/LanguageClassifier.cpp
// =================================================================
// Implementation for mapping files to programming language labels.

#include "Distill/LanguageClassifier.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <map>

namespace Distill {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

static std::string trimmed(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

LanguageClassifier::LanguageClassifier() {
    initializeExtensionMap();
    initializeFilenameMap();
    initializeInterpreterMap();
    initializeIndicators();
}

std::string LanguageClassifier::classify(const std::string& relative_path, const std::string& sample) const {
    std::string language = classifyByName(relative_path);
    if (!language.empty()) {
        return language;
    }

    language = classifyByContent(sample.substr(0, kSniffLimit));
    if (!language.empty()) {
        return language;
    }

    return "Text";
}

std::string LanguageClassifier::classifyByName(const std::string& relative_path) const {
    std::string name = baseName(relative_path);

    auto filename_it = m_filename_map.find(name);
    if (filename_it != m_filename_map.end()) {
        return filename_it->second;
    }

    std::string lower_name = toLower(name);
    filename_it = m_filename_map.find(lower_name);
    if (filename_it != m_filename_map.end()) {
        return filename_it->second;
    }

    // Dockerfile.dev, Makefile.am and friends
    if (lower_name.rfind("dockerfile", 0) == 0) {
        return "Dockerfile";
    }

    size_t dot = lower_name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }

    auto ext_it = m_extension_map.find(lower_name.substr(dot));
    if (ext_it != m_extension_map.end()) {
        return ext_it->second;
    }

    return "";
}

std::string LanguageClassifier::classifyByContent(const std::string& sample) const {
    std::string body = trimmed(sample);
    if (body.empty()) {
        return "";
    }

    std::string language = classifyByShebang(body);
    if (!language.empty()) {
        return language;
    }

    if ((body.front() == '{' && body.back() == '}') || (body.front() == '[' && body.back() == ']')) {
        if (nlohmann::json::accept(body)) {
            return "JSON";
        }
    }

    std::string lower = toLower(body.substr(0, 512));
    if (lower.find("<!doctype html") != std::string::npos || lower.find("<html") != std::string::npos) {
        return "HTML";
    }
    if (lower.rfind("<?xml", 0) == 0) {
        return "XML";
    }

    std::map<std::string, int> scores;
    for (const auto& indicator : m_indicators) {
        if (std::regex_search(body, indicator.pattern)) {
            scores[indicator.language] += indicator.weight;
        }
    }

    std::string best;
    int best_score = 0;
    // std::map iteration keeps ties deterministic
    for (const auto& entry : scores) {
        if (entry.second > best_score) {
            best = entry.first;
            best_score = entry.second;
        }
    }

    // A single weak hit is not enough evidence
    return best_score >= 3 ? best : "";
}

std::string LanguageClassifier::classifyByShebang(const std::string& sample) const {
    if (sample.rfind("#!", 0) != 0) {
        return "";
    }

    size_t newline = sample.find('\n');
    std::string line = sample.substr(2, newline == std::string::npos ? std::string::npos : newline - 2);
    std::vector<std::string> words;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t start = line.find_first_not_of(" \t", pos);
        if (start == std::string::npos) {
            break;
        }
        size_t end = line.find_first_of(" \t", start);
        words.push_back(line.substr(start, end == std::string::npos ? std::string::npos : end - start));
        pos = end == std::string::npos ? line.size() : end;
    }
    if (words.empty()) {
        return "";
    }

    std::string interpreter = baseName(words[0]);
    // "#!/usr/bin/env -S python3 -u"
    if (interpreter == "env") {
        interpreter.clear();
        for (size_t i = 1; i < words.size(); ++i) {
            if (words[i][0] != '-') {
                interpreter = words[i];
                break;
            }
        }
    }

    // python3.11 -> python
    while (!interpreter.empty() &&
           (std::isdigit(static_cast<unsigned char>(interpreter.back())) || interpreter.back() == '.')) {
        interpreter.pop_back();
    }

    auto it = m_interpreter_map.find(interpreter);
    return it != m_interpreter_map.end() ? it->second : "";
}

std::string LanguageClassifier::fenceTag(const std::string& language) {
    static const std::unordered_map<std::string, std::string> special = {
        {"C++", "cpp"},
        {"C#", "csharp"},
        {"F#", "fsharp"},
        {"Objective-C", "objectivec"},
        {"Shell", "bash"},
        {"Text", "text"},
        {"Dockerfile", "dockerfile"},
        {"CMake", "cmake"},
        {"Makefile", "makefile"},
        {"reStructuredText", "rst"},
    };

    auto it = special.find(language);
    if (it != special.end()) {
        return it->second;
    }

    std::string tag;
    for (char c : language) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            tag += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return tag.empty() ? "text" : tag;
}

void LanguageClassifier::initializeExtensionMap() {
    m_extension_map = {
        // C family
        {".c", "C"}, {".h", "C"},
        {".cpp", "C++"}, {".cc", "C++"}, {".cxx", "C++"}, {".c++", "C++"},
        {".hpp", "C++"}, {".hh", "C++"}, {".hxx", "C++"}, {".ipp", "C++"}, {".inl", "C++"},
        {".m", "Objective-C"}, {".mm", "Objective-C"},
        {".cs", "C#"}, {".fs", "F#"},
        {".java", "Java"}, {".kt", "Kotlin"}, {".kts", "Kotlin"},
        {".scala", "Scala"}, {".swift", "Swift"}, {".dart", "Dart"},
        {".go", "Go"}, {".rs", "Rust"}, {".zig", "Zig"},

        // Scripting
        {".py", "Python"}, {".pyi", "Python"}, {".pyx", "Python"}, {".pxd", "Python"},
        {".js", "JavaScript"}, {".jsx", "JavaScript"}, {".mjs", "JavaScript"}, {".cjs", "JavaScript"},
        {".ts", "TypeScript"}, {".tsx", "TypeScript"},
        {".rb", "Ruby"}, {".php", "PHP"}, {".pl", "Perl"}, {".pm", "Perl"},
        {".lua", "Lua"}, {".r", "R"}, {".jl", "Julia"},
        {".ex", "Elixir"}, {".exs", "Elixir"}, {".erl", "Erlang"}, {".hs", "Haskell"},
        {".sh", "Shell"}, {".bash", "Shell"}, {".zsh", "Shell"}, {".fish", "Shell"},
        {".ps1", "PowerShell"}, {".bat", "Batch"}, {".cmd", "Batch"},

        // Web
        {".html", "HTML"}, {".htm", "HTML"},
        {".css", "CSS"}, {".scss", "SCSS"}, {".sass", "Sass"}, {".less", "Less"},
        {".vue", "Vue"}, {".svelte", "Svelte"},

        // Data and configuration
        {".json", "JSON"}, {".xml", "XML"}, {".yaml", "YAML"}, {".yml", "YAML"},
        {".toml", "TOML"}, {".ini", "INI"}, {".cfg", "INI"}, {".conf", "INI"},
        {".sql", "SQL"}, {".proto", "Protocol Buffers"}, {".graphql", "GraphQL"},
        {".cmake", "CMake"}, {".mk", "Makefile"},

        // Documentation
        {".md", "Markdown"}, {".markdown", "Markdown"},
        {".rst", "reStructuredText"}, {".txt", "Text"}, {".tex", "TeX"},
    };
}

void LanguageClassifier::initializeFilenameMap() {
    m_filename_map = {
        {"Makefile", "Makefile"}, {"makefile", "Makefile"}, {"GNUmakefile", "Makefile"},
        {"Dockerfile", "Dockerfile"}, {"dockerfile", "Dockerfile"},
        {"CMakeLists.txt", "CMake"}, {"cmakelists.txt", "CMake"},
        {"Rakefile", "Ruby"}, {"Gemfile", "Ruby"}, {"Vagrantfile", "Ruby"},
        {"Jenkinsfile", "Groovy"},
        {".bashrc", "Shell"}, {".bash_profile", "Shell"}, {".zshrc", "Shell"}, {".profile", "Shell"},
        {".gitignore", "Text"}, {".dockerignore", "Text"},
        {"requirements.txt", "Text"},
    };
}

void LanguageClassifier::initializeInterpreterMap() {
    m_interpreter_map = {
        {"python", "Python"}, {"pypy", "Python"},
        {"sh", "Shell"}, {"bash", "Shell"}, {"zsh", "Shell"}, {"dash", "Shell"}, {"ksh", "Shell"},
        {"node", "JavaScript"}, {"nodejs", "JavaScript"}, {"deno", "TypeScript"},
        {"ruby", "Ruby"}, {"perl", "Perl"}, {"php", "PHP"}, {"lua", "Lua"},
        {"Rscript", "R"}, {"julia", "Julia"}, {"escript", "Erlang"},
    };
}

void LanguageClassifier::initializeIndicators() {
    auto add = [this](const std::string& language, const std::string& pattern, int weight) {
        m_indicators.push_back({language, std::regex(pattern, std::regex::ECMAScript | std::regex::optimize), weight});
    };

    add("Python", R"((^|\n)def\s+\w+\s*\([^)]*\)\s*(->\s*[^:]+)?:)", 3);
    add("Python", R"((^|\n)class\s+\w+(\s*\([^)]*\))?\s*:)", 3);
    add("Python", R"((^|\n)from\s+[\w.]+\s+import\s)", 2);
    add("Python", R"((^|\n)import\s+[\w.]+\s*(\n|$))", 1);
    add("Python", R"(if\s+__name__\s*==\s*['"]__main__['"])", 3);

    add("JavaScript", R"(function\s+\w+\s*\([^)]*\)\s*\{)", 3);
    add("JavaScript", R"((^|\n)(const|let|var)\s+\w+\s*=)", 2);
    add("JavaScript", R"(import\s+.*\s+from\s+['"])", 2);
    add("JavaScript", R"(=>\s*\{)", 1);
    add("JavaScript", R"(module\.exports|require\(['"])", 3);

    add("Shell", R"((^|\n)\s*(if|while)\s+\[\[?\s)", 2);
    add("Shell", R"((^|\n)\s*(fi|done|esac)\s*(\n|$))", 2);
    add("Shell", R"((^|\n)\s*export\s+[A-Z_]+=)", 2);
    add("Shell", R"(\$\{?[A-Za-z_][A-Za-z0-9_]*\}?)", 1);

    add("C++", R"((^|\n)#include\s*<[a-z_]+>)", 2);
    add("C++", R"(std::\w+)", 2);
    add("C++", R"((^|\n)\s*namespace\s+\w+\s*\{)", 2);
    add("C++", R"(template\s*<)", 2);

    add("C", R"((^|\n)#include\s*<\w+\.h>)", 2);
    add("C", R"((^|\n)int\s+main\s*\()", 1);
    add("C", R"(\b(malloc|free|printf)\s*\()", 1);
}

} // namespace Distill
