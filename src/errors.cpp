// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include "agenteval/errors.hpp"

namespace {

std::string with_line(const std::string& message, std::optional<std::size_t> line) {
    if (!line) {
        return message;
    }
    return "line " + std::to_string(*line) + ": " + message;
}

}  // namespace

namespace agenteval {

ParseError::ParseError(const std::string& message, std::optional<std::size_t> line)
    : std::runtime_error(with_line(message, line)), detail_{message}, line_{line} {}

}  // namespace agenteval
