// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace agenteval::text {

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

/// Characters removed before tokens are compared by the scorers.
inline constexpr std::string_view kStrippedPunctuation = ".,!?;:()[]\"";

[[nodiscard]] std::string trim_copy(std::string_view input);
[[nodiscard]] std::string to_lower_copy(std::string_view input);

/// Converts CRLF and lone CR line endings to LF.
[[nodiscard]] std::string normalize_newlines(std::string_view input);

/// Splits on '\n'; a trailing newline does not produce an extra empty line.
[[nodiscard]] std::vector<std::string> split_lines(std::string_view input);

/// Splits on runs of whitespace, dropping empty tokens. Case and punctuation are preserved.
[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view input);

[[nodiscard]] std::string strip_punctuation(std::string_view input);

/// Lower-case, strip kStrippedPunctuation, split on whitespace, drop empty tokens.
[[nodiscard]] std::vector<std::string> tokenize(std::string_view input);

/// Lower-case and strip kStrippedPunctuation without splitting.
[[nodiscard]] std::string normalize_token(std::string_view input);

/**
 * \brief True when both tokens denote the same number.
 *
 * Numerals 0..20 match their English word in either direction ("4" and "four"). Outside that
 * table, two tokens that both parse completely as numbers match when their values are equal.
 * Only the 0..20 table is recognised; no other locales or number words.
 */
[[nodiscard]] bool is_number_match(std::string_view a, std::string_view b);

[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view separator);

}  // namespace agenteval::text
