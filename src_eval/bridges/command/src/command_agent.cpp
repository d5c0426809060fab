#include "agenteval_eval/command_agent.hpp"

#include <utility>

using nlohmann::json;

namespace agenteval::eval {

CommandAgent::CommandAgent(std::string command, std::filesystem::path work_dir) {
    bridge_.command = std::move(command);
    bridge_.work_dir = std::move(work_dir);
    bridge_.prefix = "agenteval_agent_";
}

AgentOutput CommandAgent::process_input(const AgentInput& input) {
    json messages = json::array();
    for (const auto& message : input.messages) {
        messages.push_back({{"role", message.role}, {"content", message.content}});
    }
    const json request = {
        {"model", config().model},
        {"messages", std::move(messages)},
        {"api_key", auth().api_key},
    };

    process_bridge::Exchange exchange;
    std::string diag;
    const bool ok = process_bridge::exchange(bridge_, request, exchange, diag);

    AgentOutput out;
    const auto& response = exchange.response;
    if (response.is_object()) {
        if (const auto it = response.find("error"); it != response.end() && !it->is_null()) {
            AgentError error;
            if (it->is_object()) {
                error.message = it->value("message", std::string{"Agent reported an error"});
                error.code = it->value("code", std::string{});
            } else if (it->is_string()) {
                error.message = it->get<std::string>();
            } else {
                error.message = it->dump();
            }
            out.error = std::move(error);
            return out;
        }
        if (const auto it = response.find("response"); ok && it != response.end() && it->is_string()) {
            out.response = it->get<std::string>();
            return out;
        }
    }

    if (ok) {
        diag += "Response has no 'response' string\n";
    }
    while (!diag.empty() && diag.back() == '\n') {
        diag.pop_back();
    }
    out.error = AgentError{diag, "bridge_error"};
    return out;
}

}  // namespace agenteval::eval
