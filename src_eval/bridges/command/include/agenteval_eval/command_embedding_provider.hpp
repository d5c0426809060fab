#pragma once

#include "agenteval_eval/embedding_provider.hpp"
#include "agenteval_eval/process_bridge.hpp"

#include <filesystem>
#include <string>

namespace agenteval::eval {

/**
 * \brief Embedding provider reached through an external command.
 *
 * Request `{"model", "input", "api_key"}`; response `{"embedding": [numbers]}` or
 * `{"status": <http status>, "error": "..."}`. A command failure without a structured status
 * is reported as status 500 so the caller's retry policy treats it as transient.
 */
class CommandEmbeddingProvider final : public EmbeddingProvider {
public:
    struct Settings {
        std::string command;
        std::string model;
        std::string api_key;
        std::filesystem::path work_dir{};
    };

    explicit CommandEmbeddingProvider(Settings settings);

    [[nodiscard]] EmbeddingResponse generate_embedding(const std::string& text) override;

private:
    Settings settings_;
    process_bridge::Config bridge_;
};

}  // namespace agenteval::eval
