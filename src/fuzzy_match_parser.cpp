// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include "agenteval/fuzzy_match_parser.hpp"

#include "agenteval/errors.hpp"
#include "agenteval/text_processing.hpp"

#include <charconv>
#include <regex>
#include <utility>

namespace {

// Group 1: expected text (no brackets or pipes). Group 2: decimal threshold.
const std::regex& assertion_pattern() {
    static const std::regex pattern{R"(\[([^\[\]|]+)\|([0-9]*\.?[0-9]+)\])"};
    return pattern;
}

double parse_threshold(const std::string& raw) {
    double value = 0.0;
    const auto* first = raw.data();
    const auto* last = raw.data() + raw.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw agenteval::ParseError("Invalid fuzzy-match threshold '" + raw + "'");
    }
    if (!(value > 0.0 && value <= 1.0)) {
        throw agenteval::ParseError("Fuzzy-match threshold '" + raw + "' must be in (0, 1]");
    }
    return value;
}

}  // namespace

namespace agenteval {

std::vector<FuzzyMatchAssertion> FuzzyMatchParser::parse_assertions(std::string_view content) {
    std::vector<FuzzyMatchAssertion> out;
    const std::string input{content};
    for (auto it = std::sregex_iterator(input.begin(), input.end(), assertion_pattern());
         it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        auto expected = text::trim_copy(match[1].str());
        const auto threshold = parse_threshold(match[2].str());
        out.push_back(FuzzyMatchAssertion{expected, threshold, expected});
    }
    return out;
}

std::string FuzzyMatchParser::clean_content(std::string_view content) {
    // Nested spans such as `[[x|0.5]|0.9]` expose a new span after each pass.
    std::string current{content};
    for (;;) {
        auto next = std::regex_replace(current, assertion_pattern(), "$1");
        if (next == current) {
            return current;
        }
        current = std::move(next);
    }
}

bool FuzzyMatchParser::has_assertions(std::string_view content) {
    const std::string input{content};
    return std::regex_search(input, assertion_pattern());
}

}  // namespace agenteval
