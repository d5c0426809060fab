// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include "agenteval/rouge.hpp"

#include "agenteval/text_processing.hpp"

#include <algorithm>
#include <unordered_map>

namespace agenteval {

namespace rouge {

std::vector<std::string> ngrams(const std::vector<std::string>& tokens, std::size_t n) {
    std::vector<std::string> out;
    if (n == 0 || tokens.size() < n) {
        return out;
    }
    out.reserve(tokens.size() - n + 1);
    for (std::size_t i = 0; i + n <= tokens.size(); ++i) {
        std::string gram = tokens[i];
        for (std::size_t j = 1; j < n; ++j) {
            gram += ' ';
            gram += tokens[i + j];
        }
        out.push_back(std::move(gram));
    }
    return out;
}

std::size_t count_overlap(const std::vector<std::string>& reference,
                          const std::vector<std::string>& candidate) {
    std::unordered_map<std::string, std::size_t> available;
    for (const auto& gram : candidate) {
        ++available[gram];
    }
    std::size_t overlap = 0;
    for (const auto& gram : reference) {
        auto it = available.find(gram);
        if (it != available.end() && it->second > 0) {
            --it->second;
            ++overlap;
        }
    }
    return overlap;
}

std::size_t lcs_length(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() || b.empty()) {
        return 0;
    }
    std::vector<std::vector<std::size_t>> dp(a.size() + 1, std::vector<std::size_t>(b.size() + 1, 0));
    for (std::size_t i = 1; i <= a.size(); ++i) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                dp[i][j] = dp[i - 1][j - 1] + 1;
            } else {
                dp[i][j] = std::max(dp[i - 1][j], dp[i][j - 1]);
            }
        }
    }
    return dp[a.size()][b.size()];
}

double rouge_n(const std::vector<std::string>& reference_tokens,
               const std::vector<std::string>& candidate_tokens, std::size_t n) {
    const auto reference = ngrams(reference_tokens, n);
    if (reference.empty()) {
        return 0.0;
    }
    const auto candidate = ngrams(candidate_tokens, n);
    return static_cast<double>(count_overlap(reference, candidate)) /
           static_cast<double>(reference.size());
}

double rouge_l(const std::vector<std::string>& reference_tokens,
               const std::vector<std::string>& candidate_tokens) {
    if (reference_tokens.empty()) {
        return 0.0;
    }
    return static_cast<double>(lcs_length(reference_tokens, candidate_tokens)) /
           static_cast<double>(reference_tokens.size());
}

}  // namespace rouge

RougeScores compute_rouge(std::string_view reference, std::string_view candidate) {
    const auto ref = text::tokenize(reference);
    const auto cand = text::tokenize(candidate);
    return RougeScores{
        .rouge1 = rouge::rouge_n(ref, cand, 1),
        .rouge2 = rouge::rouge_n(ref, cand, 2),
        .rougeL = rouge::rouge_l(ref, cand),
    };
}

}  // namespace agenteval
