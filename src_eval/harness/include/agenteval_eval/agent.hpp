#pragma once

#include "agenteval/types.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace agenteval::eval {

/// Wire-level message; `role` already uses the agent spelling (see agent_role_name()).
struct AgentMessage {
    std::string role;
    std::string content;
};

struct AgentInput {
    std::vector<AgentMessage> messages;
};

struct AgentError {
    std::string message;
    std::string code;
};

struct AgentOutput {
    std::string response;
    std::optional<AgentError> error;
};

struct AgentConfig {
    std::string model;
};

struct AgentAuth {
    std::string api_key;
};

/**
 * \brief Conversational agent under evaluation.
 *
 * Transport failures are reported through AgentOutput::error. Exceptions are reserved for
 * lifecycle misuse and broken configuration.
 */
class Agent {
public:
    virtual ~Agent() = default;

    virtual void initialize(const AgentConfig& config) = 0;
    virtual void authenticate(const AgentAuth& auth) = 0;
    [[nodiscard]] virtual AgentOutput send_input(const AgentInput& input) = 0;
    /// Drops any conversation state so the next case starts clean.
    virtual void reset() = 0;
    virtual void cleanup() = 0;
};

/**
 * \brief Enforces the agent lifecycle for concrete transports.
 *
 * initialize() is accepted once; authenticate() requires initialize(); send_input() requires
 * both. Violations throw std::logic_error. cleanup() returns the agent to the uninitialised
 * state. send_input() may be called from several threads at once.
 */
class BaseAgent : public Agent {
public:
    void initialize(const AgentConfig& config) final;
    void authenticate(const AgentAuth& auth) final;
    [[nodiscard]] AgentOutput send_input(const AgentInput& input) final;
    void reset() override {}
    void cleanup() override;

    [[nodiscard]] bool initialized() const noexcept { return initialized_; }
    [[nodiscard]] bool authenticated() const noexcept { return authenticated_; }

protected:
    [[nodiscard]] virtual AgentOutput process_input(const AgentInput& input) = 0;

    /// Throws std::invalid_argument when the configuration is unusable. Requires a model.
    virtual void validate_config(const AgentConfig& config) const;

    [[nodiscard]] const AgentConfig& config() const noexcept { return config_; }
    [[nodiscard]] const AgentAuth& auth() const noexcept { return auth_; }

private:
    AgentConfig config_;
    AgentAuth auth_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> authenticated_{false};
};

/// Converts the prompt blocks of a test case into agent messages.
[[nodiscard]] AgentInput to_agent_input(const std::vector<MessageBlock>& blocks);

}  // namespace agenteval::eval
