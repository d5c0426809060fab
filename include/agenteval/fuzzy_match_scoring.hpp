// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#pragma once

#include "agenteval/types.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace agenteval {

/**
 * \brief Scores fuzzy-match assertions against an observed reply.
 *
 * A single-token expectation first looks for a direct hit (case-insensitive, punctuation
 * stripped, or numeral/word equivalence for 0..20 and plain numbers). Otherwise every window of
 * 1..min(reply tokens, min(3 * expected tokens, kMaxWindowSize)) reply tokens is scored with
 * compute_rouge and the window with the highest max(rouge1, rouge2, rougeL) wins. Ties keep the
 * earliest, shortest window. `match_position` is a half-open token range.
 *
 * Stateless; one instance can be shared across threads.
 */
class FuzzyMatchScoringService {
public:
    static constexpr std::size_t kMaxWindowSize = 10;

    [[nodiscard]] std::vector<FuzzyMatchResult> evaluate_assertions(
        const std::vector<FuzzyMatchAssertion>& assertions, std::string_view actual_response) const;

    [[nodiscard]] FuzzyMatchResult evaluate_assertion(const FuzzyMatchAssertion& assertion,
                                                      std::string_view actual_response) const;

    /// Mean final score; 1.0 for an empty list.
    [[nodiscard]] static double calculate_overall_score(const std::vector<FuzzyMatchResult>& results);

    /// True when every result passed; true for an empty list.
    [[nodiscard]] static bool all_assertions_passed(const std::vector<FuzzyMatchResult>& results);
};

}  // namespace agenteval
