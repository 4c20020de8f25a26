// =================================================================
// include/Distill/TokenAccountant.hpp
// =================================================================
// Header for per-model token counting and budget-aware truncation.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Distill {

/**
 * @brief Counts tokens for one encoding scheme
 *
 * Implementations must be safe to call concurrently through a const
 * reference, and count(prefix) must never exceed count(text).
 */
class TokenCounter {
public:
    virtual ~TokenCounter() = default;

    virtual size_t count(const std::string& text) const = 0;
    virtual std::string scheme() const = 0;
};

/**
 * @brief Built-in approximation of a byte-pair encoder
 *
 * Splits text the way BPE pretokenizers do (letter runs, digit groups,
 * punctuation, whitespace) and charges each letter run
 * ceil(length / chars_per_token) tokens.
 */
class HeuristicTokenCounter : public TokenCounter {
public:
    HeuristicTokenCounter(const std::string& scheme, double chars_per_token);

    size_t count(const std::string& text) const override;
    std::string scheme() const override { return m_scheme; }

private:
    std::string m_scheme;
    double m_chars_per_token;
};

using TokenCounterFactory = std::function<std::unique_ptr<TokenCounter>()>;

/**
 * @brief Result of fitting text to a token budget
 */
struct BudgetFit {
    std::string text;
    size_t token_count = 0;
    bool truncated = false;
};

/**
 * @brief Resolves models to counters and enforces per-file budgets
 *
 * Model names resolve to an encoding scheme by exact name, then by the
 * longest known prefix. Unknown models use cl100k_base. Counters are
 * created once per scheme and shared by all workers.
 */
class TokenAccountant {
public:
    static const char* const kTruncationMarker;
    static const char* const kDefaultScheme;
    static constexpr size_t kDefaultContextWindow = 128000;

    TokenAccountant();

    /**
     * @brief Replace the counter used for an encoding scheme
     * @param scheme Encoding scheme name, e.g. "o200k_base"
     * @param factory Creates the counter; called once
     */
    void registerCounter(const std::string& scheme, TokenCounterFactory factory);

    /**
     * @brief Count tokens of text as the given model sees it
     */
    size_t countTokens(const std::string& model, const std::string& text) const;

    /**
     * @brief Truncate text so that it fits max_tokens
     * @param model Model name
     * @param text Sanitized text
     * @param max_tokens Budget; 0 means unlimited
     * @return Fitted text, its token count and whether it was cut
     */
    BudgetFit fitToBudget(const std::string& model, const std::string& text, size_t max_tokens) const;

    /**
     * @brief Context window of a model in tokens
     */
    size_t contextWindow(const std::string& model) const;

    /**
     * @brief Encoding scheme used for a model
     */
    std::string encodingFor(const std::string& model) const;

    /**
     * @brief Check whether the model name resolves to a known profile
     */
    bool isKnownModel(const std::string& model) const;

    std::vector<std::string> getKnownModels() const;

    /**
     * @brief Rough token estimate from a byte count, used before a file is read
     */
    static size_t estimateTokens(size_t byte_count) { return (byte_count + 3) / 4; }

private:
    struct ModelProfile {
        std::string scheme;
        size_t context_window;
    };

    std::map<std::string, ModelProfile> m_profiles;
    std::map<std::string, std::shared_ptr<const TokenCounter>> m_counters;
    mutable std::mutex m_counters_mutex;

    void initializeProfiles();
    void initializeCounters();

    const ModelProfile* findProfile(const std::string& model) const;
    std::shared_ptr<const TokenCounter> counterFor(const std::string& model) const;
};

} // namespace Distill
