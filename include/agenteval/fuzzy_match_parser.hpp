// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#pragma once

#include "agenteval/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace agenteval {

/**
 * \brief Inline fuzzy-match assertions of the form `[expected text|threshold]`.
 *
 * The threshold is a plain decimal (`0.8`, `.95`, `1`) and must lie in (0,1]; anything else
 * inside a well-formed bracket throws ParseError. Brackets without a `|<number>` suffix are
 * ordinary text and are left alone.
 */
class FuzzyMatchParser {
public:
    /// Assertions in left-to-right order. Expected text is trimmed; description equals it.
    [[nodiscard]] static std::vector<FuzzyMatchAssertion> parse_assertions(std::string_view content);

    /// Replaces every assertion span with its expected text, leaving everything else untouched.
    [[nodiscard]] static std::string clean_content(std::string_view content);

    [[nodiscard]] static bool has_assertions(std::string_view content);
};

}  // namespace agenteval
