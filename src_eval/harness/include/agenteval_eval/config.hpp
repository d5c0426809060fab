#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace agenteval::eval {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ScoringMethod {
    SemanticSimilarity,
    Rouge,
    ExactMatch,
};

enum class OutputFormat {
    Json,
    Markdown,
    Text,
};

[[nodiscard]] std::optional<ScoringMethod> scoring_method_from_string(std::string_view name);
[[nodiscard]] std::string_view to_string(ScoringMethod method);
[[nodiscard]] std::optional<OutputFormat> output_format_from_string(std::string_view name);
[[nodiscard]] std::string_view to_string(OutputFormat format);

/// One runnable agent: `command` is invoked through the command bridge.
struct AgentSettings {
    std::string command;
    std::string model;
    std::string api_key;
};

struct EmbeddingSettings {
    std::string command;
    std::string model{"hebo-embeddings"};
    std::string api_key;
    int max_attempts{3};
    std::chrono::milliseconds retry_delay{1000};
};

struct EvaluationSettings {
    double threshold{0.8};
    ScoringMethod scoring_method{ScoringMethod::SemanticSimilarity};
    std::size_t max_concurrency{5};
    OutputFormat output_format{OutputFormat::Text};
    bool stop_on_error{false};
    std::filesystem::path test_dir{"examples"};
    bool case_sensitive{false};
};

/**
 * \brief Validated run configuration.
 *
 * Built once at start-up and passed by reference into the components that need it.
 */
struct Config {
    std::map<std::string, AgentSettings> agents;
    std::string default_agent;
    std::optional<EmbeddingSettings> embedding;
    EvaluationSettings evaluation;

    /// Looks up `name`, or `default_agent` when `name` is empty. Throws ConfigError when absent.
    [[nodiscard]] const AgentSettings& agent(const std::string& name) const;

    /// Range and enum checks; throws ConfigError on the first violation.
    void validate() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the process environment.
[[nodiscard]] std::optional<std::string> process_env(const std::string& name);

/// Replaces every `${NAME}` whose variable is set. Unset variables stay verbatim.
[[nodiscard]] std::string interpolate_env(std::string_view value, const EnvLookup& lookup = process_env);

/// Applies interpolate_env to every string inside `node`, recursively.
void interpolate_env_in(nlohmann::json& node, const EnvLookup& lookup = process_env);

/// Maps an already-interpolated JSON document onto Config and validates it.
[[nodiscard]] Config config_from_json(const nlohmann::json& document);

/**
 * \brief Reads, interpolates and validates a JSON configuration file.
 *
 * Throws ConfigError when the file cannot be read, is not valid JSON, or fails validation.
 */
[[nodiscard]] Config load_config(const std::filesystem::path& path, const EnvLookup& lookup = process_env);

}  // namespace agenteval::eval
