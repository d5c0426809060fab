// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include "agenteval/text_processing.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <charconv>
#include <optional>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 21> kNumberWords{{
    {"0", "zero"},      {"1", "one"},        {"2", "two"},       {"3", "three"},
    {"4", "four"},      {"5", "five"},       {"6", "six"},       {"7", "seven"},
    {"8", "eight"},     {"9", "nine"},       {"10", "ten"},      {"11", "eleven"},
    {"12", "twelve"},   {"13", "thirteen"},  {"14", "fourteen"}, {"15", "fifteen"},
    {"16", "sixteen"},  {"17", "seventeen"}, {"18", "eighteen"}, {"19", "nineteen"},
    {"20", "twenty"},
}};

std::optional<std::string_view> word_for_numeral(std::string_view numeral) {
    for (const auto& [digits, word] : kNumberWords) {
        if (digits == numeral) {
            return word;
        }
    }
    return std::nullopt;
}

std::optional<double> parse_number(std::string_view token) {
    if (token.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (*first == '+') {
        ++first;
    }
    const auto [ptr, ec] = std::from_chars(first, last, value);
    // from_chars also accepts "inf" and "nan"; only finite numerals count.
    if (ec != std::errc{} || ptr != last || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool is_whitespace(char ch) {
    return agenteval::text::kWhitespace.find(ch) != std::string_view::npos;
}

}  // namespace

namespace agenteval::text {

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::string normalize_newlines(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '\r') {
            result.push_back('\n');
            if (i + 1 < input.size() && input[i + 1] == '\n') {
                ++i;
            }
        } else {
            result.push_back(input[i]);
        }
    }
    return result;
}

std::vector<std::string> split_lines(std::string_view input) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < input.size()) {
        const auto end = input.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(input.substr(start));
            break;
        }
        lines.emplace_back(input.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::vector<std::string> split_whitespace(std::string_view input) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : input) {
        if (is_whitespace(ch)) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::string strip_punctuation(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (char ch : input) {
        if (kStrippedPunctuation.find(ch) == std::string_view::npos) {
            result.push_back(ch);
        }
    }
    return result;
}

std::string normalize_token(std::string_view input) {
    return strip_punctuation(to_lower_copy(input));
}

std::vector<std::string> tokenize(std::string_view input) {
    return split_whitespace(normalize_token(input));
}

bool is_number_match(std::string_view a, std::string_view b) {
    if (const auto word = word_for_numeral(a); word && *word == b) {
        return true;
    }
    if (const auto word = word_for_numeral(b); word && *word == a) {
        return true;
    }
    const auto lhs = parse_number(a);
    const auto rhs = parse_number(b);
    return lhs && rhs && *lhs == *rhs;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            result.append(separator);
        }
        result.append(parts[i]);
    }
    return result;
}

}  // namespace agenteval::text
