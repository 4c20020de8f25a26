// =================================================================
// src/Distill/TokenAccountant.cpp
// =================================================================
// Implementation for per-model token counting and budget-aware truncation.

#include "Distill/TokenAccountant.hpp"
#include "Distill/Logger.hpp"
#include <cmath>
#include <cctype>

namespace Distill {

const char* const TokenAccountant::kTruncationMarker = "\n[... truncated: content exceeds token budget ...]\n";
const char* const TokenAccountant::kDefaultScheme = "cl100k_base";

namespace {

enum class CharClass {
    Letter,
    Digit,
    Space,
    Newline,
    Punct,
    Wide
};

CharClass classifyByte(unsigned char c) {
    if (c >= 0x80) {
        return CharClass::Wide;
    }
    if (std::isalpha(c) || c == '_') {
        return CharClass::Letter;
    }
    if (std::isdigit(c)) {
        return CharClass::Digit;
    }
    if (c == ' ' || c == '\t') {
        return CharClass::Space;
    }
    if (c == '\n') {
        return CharClass::Newline;
    }
    return CharClass::Punct;
}

size_t ceilDiv(size_t length, double divisor) {
    return static_cast<size_t>(std::ceil(static_cast<double>(length) / divisor));
}

// Largest byte offset <= pos that does not split a UTF-8 sequence
size_t snapToCodePoint(const std::string& text, size_t pos) {
    if (pos >= text.size()) {
        return text.size();
    }
    while (pos > 0 && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

} // namespace

// HeuristicTokenCounter implementation

HeuristicTokenCounter::HeuristicTokenCounter(const std::string& scheme, double chars_per_token)
    : m_scheme(scheme), m_chars_per_token(chars_per_token > 0.0 ? chars_per_token : 4.0) {
}

size_t HeuristicTokenCounter::count(const std::string& text) const {
    size_t tokens = 0;
    const size_t length = text.size();
    size_t i = 0;

    while (i < length) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        CharClass char_class = classifyByte(c);

        if (char_class == CharClass::Wide) {
            // One token per non-ASCII code point
            ++tokens;
            ++i;
            while (i < length && (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) {
                ++i;
            }
            continue;
        }

        if (char_class == CharClass::Punct) {
            ++tokens;
            ++i;
            continue;
        }

        size_t run_start = i;
        while (i < length && classifyByte(static_cast<unsigned char>(text[i])) == char_class) {
            ++i;
        }
        size_t run = i - run_start;

        switch (char_class) {
            case CharClass::Letter:
                tokens += ceilDiv(run, m_chars_per_token);
                break;
            case CharClass::Digit:
                // Digits are grouped in threes
                tokens += (run + 2) / 3;
                break;
            case CharClass::Space:
                // A single space merges into the following word
                tokens += run == 1 ? 0 : ceilDiv(run, 4.0);
                break;
            case CharClass::Newline:
                tokens += ceilDiv(run, 2.0);
                break;
            default:
                break;
        }
    }

    return tokens;
}

// TokenAccountant implementation

TokenAccountant::TokenAccountant() {
    initializeProfiles();
    initializeCounters();
}

void TokenAccountant::registerCounter(const std::string& scheme, TokenCounterFactory factory) {
    std::shared_ptr<const TokenCounter> counter(factory());
    if (!counter) {
        Logger::getInstance().warning("TokenAccountant", "Counter factory returned nothing", scheme);
        return;
    }

    std::lock_guard<std::mutex> lock(m_counters_mutex);
    m_counters[scheme] = std::move(counter);
}

size_t TokenAccountant::countTokens(const std::string& model, const std::string& text) const {
    if (text.empty()) {
        return 0;
    }
    return counterFor(model)->count(text);
}

BudgetFit TokenAccountant::fitToBudget(const std::string& model, const std::string& text, size_t max_tokens) const {
    auto counter = counterFor(model);

    BudgetFit fit;
    fit.token_count = counter->count(text);
    if (max_tokens == 0 || fit.token_count <= max_tokens) {
        fit.text = text;
        return fit;
    }

    fit.truncated = true;
    const std::string marker = kTruncationMarker;
    const bool with_marker = counter->count(marker) <= max_tokens;
    const std::string suffix = with_marker ? marker : std::string();

    auto fits = [&](size_t prefix_length) {
        return counter->count(text.substr(0, snapToCodePoint(text, prefix_length)) + suffix) <= max_tokens;
    };

    // Largest prefix length that still fits; length 0 always does
    size_t low = 0;
    size_t high = text.size();
    while (low < high) {
        size_t mid = low + (high - low + 1) / 2;
        if (fits(mid)) {
            low = mid;
        } else {
            high = mid - 1;
        }
    }

    std::string prefix = text.substr(0, snapToCodePoint(text, low));

    // Prefer ending on a complete line when one is reasonably close
    size_t last_newline = prefix.find_last_of('\n');
    if (last_newline != std::string::npos && last_newline + 1 >= prefix.size() / 2) {
        std::string line_prefix = prefix.substr(0, last_newline + 1);
        if (counter->count(line_prefix + suffix) <= max_tokens) {
            prefix = std::move(line_prefix);
        }
    }

    fit.text = prefix + suffix;
    fit.token_count = counter->count(fit.text);
    return fit;
}

size_t TokenAccountant::contextWindow(const std::string& model) const {
    const ModelProfile* profile = findProfile(model);
    return profile ? profile->context_window : kDefaultContextWindow;
}

std::string TokenAccountant::encodingFor(const std::string& model) const {
    const ModelProfile* profile = findProfile(model);
    return profile ? profile->scheme : kDefaultScheme;
}

bool TokenAccountant::isKnownModel(const std::string& model) const {
    return findProfile(model) != nullptr;
}

std::vector<std::string> TokenAccountant::getKnownModels() const {
    std::vector<std::string> models;
    for (const auto& entry : m_profiles) {
        models.push_back(entry.first);
    }
    return models;
}

const TokenAccountant::ModelProfile* TokenAccountant::findProfile(const std::string& model) const {
    auto exact = m_profiles.find(model);
    if (exact != m_profiles.end()) {
        return &exact->second;
    }

    // "gpt-4o-2024-08-06" resolves through "gpt-4o", not "gpt-4"
    const ModelProfile* best = nullptr;
    size_t best_length = 0;
    for (const auto& entry : m_profiles) {
        if (entry.first.size() > best_length && model.compare(0, entry.first.size(), entry.first) == 0) {
            best = &entry.second;
            best_length = entry.first.size();
        }
    }
    return best;
}

std::shared_ptr<const TokenCounter> TokenAccountant::counterFor(const std::string& model) const {
    std::string scheme = encodingFor(model);

    std::lock_guard<std::mutex> lock(m_counters_mutex);
    auto it = m_counters.find(scheme);
    if (it != m_counters.end()) {
        return it->second;
    }
    return m_counters.at(kDefaultScheme);
}

void TokenAccountant::initializeProfiles() {
    m_profiles = {
        // o200k_base
        {"gpt-4o", {"o200k_base", 128000}},
        {"gpt-4o-mini", {"o200k_base", 128000}},
        {"chatgpt-4o", {"o200k_base", 128000}},
        {"gpt-4.1", {"o200k_base", 1047576}},
        {"o1", {"o200k_base", 200000}},
        {"o1-mini", {"o200k_base", 128000}},
        {"o1-preview", {"o200k_base", 128000}},
        {"o3-mini", {"o200k_base", 200000}},

        // cl100k_base
        {"gpt-4", {"cl100k_base", 8192}},
        {"gpt-4-32k", {"cl100k_base", 32768}},
        {"gpt-4-turbo", {"cl100k_base", 128000}},
        {"gpt-3.5-turbo", {"cl100k_base", 16385}},
        {"gpt-35-turbo", {"cl100k_base", 16385}},
        {"text-embedding-ada-002", {"cl100k_base", 8191}},

        // Other vendors, counted with cl100k_base
        {"claude-3-opus", {"cl100k_base", 200000}},
        {"claude-3-sonnet", {"cl100k_base", 200000}},
        {"claude-3-haiku", {"cl100k_base", 200000}},
        {"claude-3-5-sonnet", {"cl100k_base", 200000}},
        {"gemini-2.0-flash", {"cl100k_base", 1048576}},
        {"gemini-2.0-flash-lite-preview", {"cl100k_base", 1048576}},
        {"gemini-1.5-pro", {"cl100k_base", 2097152}},
        {"deepseek-r1", {"cl100k_base", 128000}},

        // p50k_base
        {"text-davinci-003", {"p50k_base", 4097}},
        {"text-davinci-002", {"p50k_base", 4097}},
        {"code-davinci-002", {"p50k_base", 8001}},
        {"code-cushman-001", {"p50k_base", 2048}},

        // r50k_base
        {"text-davinci-001", {"r50k_base", 2049}},
        {"davinci", {"r50k_base", 2049}},
        {"curie", {"r50k_base", 2049}},
        {"babbage", {"r50k_base", 2049}},
        {"ada", {"r50k_base", 2049}},

        {"gpt2", {"gpt2", 1024}},
    };
}

void TokenAccountant::initializeCounters() {
    // Average characters per token of English-heavy source code
    const std::map<std::string, double> ratios = {
        {"o200k_base", 4.4},
        {"cl100k_base", 4.0},
        {"p50k_base", 3.6},
        {"r50k_base", 3.4},
        {"gpt2", 3.4},
    };

    for (const auto& entry : ratios) {
        m_counters[entry.first] = std::make_shared<HeuristicTokenCounter>(entry.first, entry.second);
    }
}

} // namespace Distill
