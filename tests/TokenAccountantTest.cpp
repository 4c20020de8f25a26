// =================================================================
// tests/TokenAccountantTest.cpp
// =================================================================
// Unit tests for TokenAccountant component.

#include "Distill/EncodingDetector.hpp"
#include "Distill/TokenAccountant.hpp"
#include <iostream>
#include <cassert>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

// Counts one token per byte, handy for exact budget arithmetic
class ByteCounter : public Distill::TokenCounter {
public:
    size_t count(const std::string& text) const override { return text.size(); }
    std::string scheme() const override { return "bytes"; }
};

std::string sampleSource() {
    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "int value_" + std::to_string(i) + " = compute(" + std::to_string(i * 7) + ");\n";
    }
    return text;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

class TokenAccountantTest {
public:
    void testHeuristicCounts() {
        std::cout << "Testing heuristic token counts..." << std::endl;

        Distill::TokenAccountant accountant;

        assert(accountant.countTokens("gpt-4", "") == 0);
        assert(accountant.countTokens("gpt-4", "hello world") == 4 && "Two words of five letters, free single space");
        assert(accountant.countTokens("gpt-4", "12345") == 2 && "Digits group in threes");
        assert(accountant.countTokens("gpt-4", "a\n\nb") == 3);
        assert(accountant.countTokens("gpt-4", "f(x);") == 5 && "Punctuation costs one token each");
        assert(accountant.countTokens("gpt-4", "\xC3\xA9\xE2\x82\xAC") == 2 && "One token per non-ASCII code point");

        std::string source = sampleSource();
        assert(accountant.countTokens("gpt-4", source) > 0);
        assert(accountant.countTokens("gpt-4", source) == accountant.countTokens("gpt-4", source) &&
               "Counting is deterministic");

        std::cout << "✓ Heuristic counts test passed" << std::endl;
    }

    void testModelResolution() {
        std::cout << "Testing model resolution..." << std::endl;

        Distill::TokenAccountant accountant;

        assert(accountant.encodingFor("gpt-4o") == "o200k_base");
        assert(accountant.encodingFor("gpt-4o-2024-08-06") == "o200k_base" && "Longest prefix wins over gpt-4");
        assert(accountant.encodingFor("gpt-4-0613") == "cl100k_base");
        assert(accountant.encodingFor("text-davinci-003") == "p50k_base");
        assert(accountant.contextWindow("claude-3-5-sonnet-20241022") == 200000);

        assert(!accountant.isKnownModel("my-local-model"));
        assert(accountant.encodingFor("my-local-model") == Distill::TokenAccountant::kDefaultScheme);
        assert(accountant.contextWindow("my-local-model") == Distill::TokenAccountant::kDefaultContextWindow);

        auto models = accountant.getKnownModels();
        assert(!models.empty());

        std::cout << "✓ Model resolution test passed" << std::endl;
    }

    void testFitWithinBudget() {
        std::cout << "Testing text that already fits..." << std::endl;

        Distill::TokenAccountant accountant;
        std::string text = "short text\n";

        auto fit = accountant.fitToBudget("gpt-4o", text, 100);
        assert(!fit.truncated);
        assert(fit.text == text);
        assert(fit.token_count == accountant.countTokens("gpt-4o", text));

        auto unlimited = accountant.fitToBudget("gpt-4o", sampleSource(), 0);
        assert(!unlimited.truncated && "A budget of 0 means unlimited");

        std::cout << "✓ Fit within budget test passed" << std::endl;
    }

    void testTruncation() {
        std::cout << "Testing truncation..." << std::endl;

        Distill::TokenAccountant accountant;
        const std::string marker = Distill::TokenAccountant::kTruncationMarker;
        std::string text = sampleSource();

        for (size_t budget : {50u, 200u, 777u}) {
            auto fit = accountant.fitToBudget("gpt-4", text, budget);
            assert(fit.truncated);
            assert(fit.token_count <= budget && "Truncated text respects the budget");
            assert(fit.token_count == accountant.countTokens("gpt-4", fit.text));
            assert(endsWith(fit.text, marker) && "A marker announces the cut");

            std::string kept = fit.text.substr(0, fit.text.size() - marker.size());
            assert(text.compare(0, kept.size(), kept) == 0 && "Truncation keeps a prefix");
            assert(!kept.empty());
        }

        std::cout << "✓ Truncation test passed" << std::endl;
    }

    void testTinyBudgetDropsMarker() {
        std::cout << "Testing budgets smaller than the marker..." << std::endl;

        Distill::TokenAccountant accountant;
        const std::string marker = Distill::TokenAccountant::kTruncationMarker;

        auto fit = accountant.fitToBudget("gpt-4", sampleSource(), 1);
        assert(fit.truncated);
        assert(fit.token_count <= 1);
        assert(fit.text.find("truncated") == std::string::npos && "The marker is left out when it cannot fit");

        std::cout << "✓ Tiny budget test passed" << std::endl;
    }

    void testUtf8Boundaries() {
        std::cout << "Testing truncation on code point boundaries..." << std::endl;

        Distill::TokenAccountant accountant;
        std::string text;
        for (int i = 0; i < 300; ++i) {
            text += "\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
        }

        for (size_t budget : {40u, 41u, 42u, 100u}) {
            auto fit = accountant.fitToBudget("gpt-4", text, budget);
            assert(fit.truncated);
            assert(fit.token_count <= budget);
            assert(Distill::EncodingDetector::isValidUtf8(fit.text) && "No split multi-byte sequence");
        }

        std::cout << "✓ UTF-8 boundaries test passed" << std::endl;
    }

    void testCustomCounter() {
        std::cout << "Testing custom counter registration..." << std::endl;

        Distill::TokenAccountant accountant;
        accountant.registerCounter("o200k_base", []() { return std::make_unique<ByteCounter>(); });

        assert(accountant.countTokens("gpt-4o", "abcdef") == 6);
        assert(accountant.countTokens("gpt-4", "abcdef") != 6 && "Other schemes keep their counter");

        const std::string marker = Distill::TokenAccountant::kTruncationMarker;
        std::string text(500, 'x');
        size_t budget = marker.size() + 100;
        auto fit = accountant.fitToBudget("gpt-4o", text, budget);
        assert(fit.truncated);
        assert(fit.token_count == budget && "Byte counting fills the budget exactly");
        assert(fit.text == std::string(100, 'x') + marker);

        std::cout << "✓ Custom counter test passed" << std::endl;
    }

    void testConcurrentCounting() {
        std::cout << "Testing concurrent counting..." << std::endl;

        Distill::TokenAccountant accountant;
        std::string text = sampleSource();
        size_t expected = accountant.countTokens("gpt-4o", text);

        std::vector<std::thread> threads;
        std::vector<size_t> results(8, 0);
        for (size_t t = 0; t < results.size(); ++t) {
            threads.emplace_back([&accountant, &text, &results, t]() {
                for (int i = 0; i < 20; ++i) {
                    results[t] = accountant.countTokens("gpt-4o", text);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        for (size_t result : results) {
            assert(result == expected);
        }

        std::cout << "✓ Concurrent counting test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TokenAccountant unit tests..." << std::endl;

        testHeuristicCounts();
        testModelResolution();
        testFitWithinBudget();
        testTruncation();
        testTinyBudgetDropsMarker();
        testUtf8Boundaries();
        testCustomCounter();
        testConcurrentCounting();

        std::cout << "All TokenAccountant tests passed!" << std::endl;
    }
};

int main() {
    try {
        TokenAccountantTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All TokenAccountant component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
