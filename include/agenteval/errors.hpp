// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace agenteval {

/**
 * \brief Structural violation found while tokenizing or parsing test-case text.
 *
 * Always fatal for the file or section being parsed. The line number, when known, is 1-based
 * and relative to the text handed to the tokenizer.
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message, std::optional<std::size_t> line = std::nullopt);

    [[nodiscard]] std::optional<std::size_t> line() const noexcept { return line_; }

    /// Message without the `line N: ` prefix.
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
    std::optional<std::size_t> line_;
};

}  // namespace agenteval
