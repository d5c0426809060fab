// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#pragma once

#include "agenteval/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace agenteval {

/**
 * \brief ROUGE-1, ROUGE-2 and ROUGE-L recall of `candidate` against `reference`.
 *
 * Both strings go through text::tokenize. Each score is in [0,1] and is 0 when the reference has
 * no n-grams of the required length (so ROUGE-2 of a one-token reference is 0).
 */
[[nodiscard]] RougeScores compute_rouge(std::string_view reference, std::string_view candidate);

namespace rouge {

/// Contiguous n-token windows, each joined with a single space.
[[nodiscard]] std::vector<std::string> ngrams(const std::vector<std::string>& tokens, std::size_t n);

/// Reference n-grams matched against a decrementing candidate multiset.
[[nodiscard]] std::size_t count_overlap(const std::vector<std::string>& reference,
                                        const std::vector<std::string>& candidate);

[[nodiscard]] std::size_t lcs_length(const std::vector<std::string>& a,
                                     const std::vector<std::string>& b);

[[nodiscard]] double rouge_n(const std::vector<std::string>& reference_tokens,
                             const std::vector<std::string>& candidate_tokens, std::size_t n);

[[nodiscard]] double rouge_l(const std::vector<std::string>& reference_tokens,
                             const std::vector<std::string>& candidate_tokens);

}  // namespace rouge

}  // namespace agenteval
