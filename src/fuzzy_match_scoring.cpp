// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include "agenteval/fuzzy_match_scoring.hpp"

#include "agenteval/rouge.hpp"
#include "agenteval/text_processing.hpp"

#include <algorithm>

namespace agenteval {

std::vector<FuzzyMatchResult> FuzzyMatchScoringService::evaluate_assertions(
    const std::vector<FuzzyMatchAssertion>& assertions, std::string_view actual_response) const {
    std::vector<FuzzyMatchResult> out;
    out.reserve(assertions.size());
    for (const auto& assertion : assertions) {
        out.push_back(evaluate_assertion(assertion, actual_response));
    }
    return out;
}

FuzzyMatchResult FuzzyMatchScoringService::evaluate_assertion(const FuzzyMatchAssertion& assertion,
                                                              std::string_view actual_response) const {
    FuzzyMatchResult result;
    result.assertion = assertion;

    const auto tokens = text::split_whitespace(actual_response);
    const auto expected_tokens = text::split_whitespace(assertion.expected_text);

    if (expected_tokens.size() == 1) {
        const auto expected = text::normalize_token(expected_tokens.front());
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const auto token = text::normalize_token(tokens[i]);
            if (token == expected || text::is_number_match(expected, token)) {
                result.final_score = 1.0;
                result.best_match = tokens[i];
                result.match_position = MatchPosition{i, i + 1};
                result.rouge_scores = RougeScores{1.0, 1.0, 1.0};
                break;
            }
        }
    }

    if (result.final_score == 0.0) {
        const auto max_window =
            std::min(tokens.size(), std::min(expected_tokens.size() * 3, kMaxWindowSize));
        for (std::size_t size = 1; size <= max_window; ++size) {
            for (std::size_t start = 0; start + size <= tokens.size(); ++start) {
                const std::vector<std::string> slice(tokens.begin() + static_cast<std::ptrdiff_t>(start),
                                                     tokens.begin() + static_cast<std::ptrdiff_t>(start + size));
                auto window = text::join(slice, " ");
                const auto scores = compute_rouge(assertion.expected_text, window);
                const auto score = std::max({scores.rouge1, scores.rouge2, scores.rougeL});
                if (score > result.final_score) {
                    result.final_score = score;
                    result.best_match = std::move(window);
                    result.match_position = MatchPosition{start, start + size};
                    result.rouge_scores = scores;
                }
            }
        }
    }

    result.passed = result.final_score >= assertion.threshold;
    return result;
}

double FuzzyMatchScoringService::calculate_overall_score(const std::vector<FuzzyMatchResult>& results) {
    if (results.empty()) {
        return 1.0;
    }
    double total = 0.0;
    for (const auto& result : results) {
        total += result.final_score;
    }
    return total / static_cast<double>(results.size());
}

bool FuzzyMatchScoringService::all_assertions_passed(const std::vector<FuzzyMatchResult>& results) {
    return std::all_of(results.begin(), results.end(),
                       [](const FuzzyMatchResult& r) { return r.passed; });
}

}  // namespace agenteval
