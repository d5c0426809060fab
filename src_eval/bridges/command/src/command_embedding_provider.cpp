#include "agenteval_eval/command_embedding_provider.hpp"

#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace agenteval::eval {

CommandEmbeddingProvider::CommandEmbeddingProvider(Settings settings)
    : settings_(std::move(settings)) {
    if (settings_.command.empty()) {
        throw std::invalid_argument("Embedding command is required");
    }
    bridge_.command = settings_.command;
    bridge_.work_dir = settings_.work_dir;
    bridge_.prefix = "agenteval_embed_";
}

EmbeddingResponse CommandEmbeddingProvider::generate_embedding(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Text cannot be empty");
    }

    const json request = {
        {"model", settings_.model},
        {"input", text},
        {"api_key", settings_.api_key},
    };

    process_bridge::Exchange exchange;
    std::string diag;
    const bool ok = process_bridge::exchange(bridge_, request, exchange, diag);
    const auto& response = exchange.response;

    if (response.is_object() && response.contains("error") && !response["error"].is_null()) {
        const auto& error = response["error"];
        const auto message = error.is_string() ? error.get<std::string>() : error.dump();
        throw EmbeddingError("Embedding request failed: " + message, response.value("status", 0));
    }
    if (!ok) {
        throw EmbeddingError("Embedding command failed: " + diag, 500);
    }

    const auto it = response.find("embedding");
    if (it == response.end() || !it->is_array() || it->empty()) {
        throw EmbeddingError("Embedding response has no 'embedding' array", 0);
    }
    EmbeddingResponse out;
    out.embedding.reserve(it->size());
    for (const auto& value : *it) {
        if (!value.is_number()) {
            throw EmbeddingError("Embedding array contains a non-numeric value", 0);
        }
        out.embedding.push_back(value.get<double>());
    }
    return out;
}

}  // namespace agenteval::eval
