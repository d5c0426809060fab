#pragma once

#include "agenteval_eval/agent.hpp"
#include "agenteval_eval/process_bridge.hpp"

#include <filesystem>
#include <string>

namespace agenteval::eval {

/**
 * \brief Agent reached through an external command.
 *
 * Request file:
 * \code{.json}
 * {"model": "...", "messages": [{"role": "user", "content": "..."}], "api_key": "..."}
 * \endcode
 * Response file: `{"response": "..."}` or `{"error": {"message": "...", "code": "..."}}`.
 * A failed command or unreadable response becomes an AgentOutput error with code
 * `bridge_error`. The agent itself keeps no conversation state between calls.
 */
class CommandAgent final : public BaseAgent {
public:
    explicit CommandAgent(std::string command, std::filesystem::path work_dir = {});

    [[nodiscard]] const std::string& command() const noexcept { return bridge_.command; }

protected:
    [[nodiscard]] AgentOutput process_input(const AgentInput& input) override;

private:
    process_bridge::Config bridge_;
};

}  // namespace agenteval::eval
