// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace agenteval {

enum class ElementKind {
    Role,
    Content,
    ToolUse,
    ToolResponse,
    Args,
};

[[nodiscard]] std::string_view element_kind_name(ElementKind kind);

/**
 * \brief One typed unit of the test-case language.
 *
 * `value` is the payload (role token, content text, tool remainder). `source` keeps the trimmed
 * line text for tool and args lines so callers can reproduce them verbatim. `line` is the 1-based
 * line where the element starts.
 */
struct Element {
    ElementKind kind{ElementKind::Content};
    std::string value;
    std::string source;
    std::size_t line{0};
};

enum class TokenizerState {
    Idle,    ///< no role seen yet
    InRole,  ///< lines accumulate under the current role
    InFence, ///< inside a ``` block, classification suspended
};

enum class LineKind {
    Blank,
    FenceDelimiter,
    ToolUse,
    ToolResponse,
    Args,
    RoleMarker,
    Markdown,
    Text,
};

struct LineClassification {
    LineKind kind{LineKind::Text};
    std::string marker;     ///< role token for RoleMarker lines (lower-case)
    std::string remainder;  ///< text after the marker
};

/**
 * \brief Splits test-case text into a flat element stream.
 *
 * Lines are classified in priority order: fence delimiter, `tool use:`, `tool response:`,
 * `args:`, role marker, markdown structure, plain text. Classification feeds a single
 * state x line-kind dispatch table. Consecutive content lines under one role are buffered and
 * flushed as one Content element on blank line, role change, tool line or end of input. A fenced
 * block is emitted verbatim as its own Content element, blank lines included.
 *
 * Content with no active role throws ParseError("All messages must have a role marker").
 * The tokenizer is stateless; each call runs its own machine.
 */
class Tokenizer {
public:
    Tokenizer() = default;

    [[nodiscard]] std::vector<Element> tokenize(std::string_view text) const;

    /// Same as tokenize(text); non-fatal advisories are appended to `warnings`.
    [[nodiscard]] std::vector<Element> tokenize(std::string_view text,
                                                std::vector<std::string>& warnings) const;

    [[nodiscard]] static LineClassification classify_line(std::string_view line);

    /// Advisory pass: a ToolUse element should be followed by Args or ToolResponse.
    [[nodiscard]] static std::vector<std::string> validate(const std::vector<Element>& elements);
};

}  // namespace agenteval
