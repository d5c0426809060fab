#include "agenteval_eval/agent.hpp"

#include <stdexcept>

namespace agenteval::eval {

void BaseAgent::initialize(const AgentConfig& config) {
    if (initialized_) {
        throw std::logic_error(
            "Agent is already initialized. Create a new instance to use a different configuration.");
    }
    validate_config(config);
    config_ = config;
    initialized_ = true;
}

void BaseAgent::authenticate(const AgentAuth& auth) {
    if (!initialized_) {
        throw std::logic_error("Agent must be initialized before authentication");
    }
    auth_ = auth;
    authenticated_ = true;
}

AgentOutput BaseAgent::send_input(const AgentInput& input) {
    if (!initialized_) {
        throw std::logic_error("Agent must be initialized before sending input");
    }
    if (!authenticated_) {
        throw std::logic_error("Agent must be authenticated before sending input");
    }
    return process_input(input);
}

void BaseAgent::cleanup() {
    initialized_ = false;
    authenticated_ = false;
    auth_ = AgentAuth{};
}

void BaseAgent::validate_config(const AgentConfig& config) const {
    if (config.model.empty()) {
        throw std::invalid_argument("Agent model is required");
    }
}

AgentInput to_agent_input(const std::vector<MessageBlock>& blocks) {
    AgentInput input;
    input.messages.reserve(blocks.size());
    for (const auto& block : blocks) {
        input.messages.push_back(AgentMessage{std::string{agent_role_name(block.role)}, block.content});
    }
    return input;
}

}  // namespace agenteval::eval
