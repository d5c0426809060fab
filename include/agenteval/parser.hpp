// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#pragma once

#include "agenteval/tokenizer.hpp"
#include "agenteval/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agenteval {

/**
 * \brief Result of reading the optional `---` frontmatter of a multi-case file.
 *
 * `body_line` is the 0-based index of the first line after the closing delimiter (0 when the text
 * has no frontmatter).
 */
struct Frontmatter {
    std::optional<int> runs;
    std::size_t body_line{0};
};

/**
 * \brief Turns test-case text into TestCase values.
 *
 * Stateless. ParseError line numbers are relative to the text passed in, so a caller holding the
 * file path has everything needed for a precise report.
 */
class Parser {
public:
    Parser() = default;

    /**
     * \brief Parses a single test case.
     *
     * A leading `#`/`##` title line is dropped. The remaining text is tokenized and folded into
     * message blocks; assistant blocks have their fuzzy-match brackets extracted and cleaned.
     * `id` defaults to `name` when empty.
     */
    [[nodiscard]] TestCase parse(std::string_view text, const std::string& name,
                                 const std::string& id = {}) const;
    [[nodiscard]] TestCase parse(std::string_view text, const std::string& name,
                                 const std::string& id, std::vector<std::string>& warnings) const;

    /**
     * \brief Parses a file that may hold several `# Title` sections.
     *
     * Without frontmatter and without section headers the whole text becomes one case named
     * `base_name` with id `hierarchical_id`. Otherwise every section yields a case with id
     * `<hierarchical_id>/<title>` and the frontmatter `runs` copied onto it.
     */
    [[nodiscard]] std::vector<TestCase> parse_multiple(std::string_view text,
                                                       const std::string& base_name,
                                                       const std::string& hierarchical_id) const;
    [[nodiscard]] std::vector<TestCase> parse_multiple(std::string_view text,
                                                       const std::string& base_name,
                                                       const std::string& hierarchical_id,
                                                       std::vector<std::string>& warnings) const;

    /// Throws ParseError for an empty block list or a system block after a non-system block.
    static void validate_test_case(const TestCase& test_case);

    /// Reads only `runs` from a leading `---` block. Lines must already be newline-normalised.
    [[nodiscard]] static Frontmatter parse_frontmatter(const std::vector<std::string>& lines);

private:
    Tokenizer tokenizer_;
};

}  // namespace agenteval
