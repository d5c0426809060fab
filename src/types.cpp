// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include "agenteval/types.hpp"
#include "agenteval/text_processing.hpp"

namespace agenteval {

std::optional<Role> role_from_token(std::string_view token) {
    const auto lowered = text::to_lower_copy(text::trim_copy(token));
    if (lowered == "user") return Role::User;
    if (lowered == "assistant") return Role::Assistant;
    if (lowered == "system") return Role::System;
    if (lowered == "developer") return Role::Developer;
    if (lowered == "human agent" || lowered == "human_agent") return Role::HumanAgent;
    if (lowered == "tool" || lowered == "function") return Role::Tool;
    return std::nullopt;
}

std::string_view role_name(Role role) {
    switch (role) {
        case Role::User:       return "user";
        case Role::Assistant:  return "assistant";
        case Role::System:     return "system";
        case Role::HumanAgent: return "human_agent";
        case Role::Tool:       return "tool";
        case Role::Developer:  return "developer";
    }
    return "user";
}

std::string_view agent_role_name(Role role) {
    switch (role) {
        case Role::Assistant:
        case Role::HumanAgent: return "assistant";
        case Role::Tool:       return "function";
        case Role::System:     return "system";
        case Role::Developer:  return "developer";
        case Role::User:       return "user";
    }
    return "user";
}

}  // namespace agenteval
