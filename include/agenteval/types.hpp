// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agenteval {

/**
 * \brief Speaker of a message block.
 *
 * `Tool` covers both the `tool` and `function` spellings of the test-case language.
 */
enum class Role {
    User,
    Assistant,
    System,
    HumanAgent,
    Tool,
    Developer,
};

/**
 * \brief Maps a raw role token (case-insensitive) onto the Role enum.
 *
 * Accepted tokens: `user`, `assistant`, `system`, `developer`, `human agent`, `human_agent`,
 * `tool`, `function`. Returns std::nullopt for anything else.
 */
[[nodiscard]] std::optional<Role> role_from_token(std::string_view token);

/// Canonical lower-case name (`human_agent` for Role::HumanAgent).
[[nodiscard]] std::string_view role_name(Role role);

/// Role spelling used on the agent wire format (`human_agent` -> `assistant`, `tool` -> `function`).
[[nodiscard]] std::string_view agent_role_name(Role role);

struct ToolUsage {
    std::string name;
    std::string args;  ///< Raw textual payload, never decoded here.
};

struct ToolResponse {
    std::string content;
};

struct MessageBlock {
    Role role{Role::User};
    std::string content;
    std::vector<ToolUsage> tool_usages;
    std::vector<ToolResponse> tool_responses;
};

struct FuzzyMatchAssertion {
    std::string expected_text;
    double threshold{0.0};
    std::string description;
};

/**
 * \brief One scripted conversation.
 *
 * The final block is the expected output; all preceding blocks form the prompt.
 */
struct TestCase {
    std::string id;    ///< `<folder-relative-path>/<title>`
    std::string name;  ///< bare title
    std::vector<MessageBlock> message_blocks;
    std::vector<FuzzyMatchAssertion> fuzzy_match_assertions;
    std::optional<int> runs;

    [[nodiscard]] bool has_fuzzy_match_assertions() const noexcept {
        return !fuzzy_match_assertions.empty();
    }
};

struct RougeScores {
    double rouge1{0.0};
    double rouge2{0.0};
    double rougeL{0.0};
};

struct MatchPosition {
    std::size_t start{0};
    std::size_t end{0};
};

struct FuzzyMatchResult {
    FuzzyMatchAssertion assertion;
    bool passed{false};
    std::string best_match;
    RougeScores rouge_scores;
    double final_score{0.0};
    MatchPosition match_position;
};

}  // namespace agenteval
