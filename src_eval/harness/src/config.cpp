#include "agenteval_eval/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace {

using agenteval::eval::ConfigError;
using nlohmann::json;

template <typename T>
T get_or(const json& object, const char* key, T fallback, const std::string& where) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("Invalid value for '" + where + "." + key + "': " + e.what());
    }
}

const json& require_object(const json& node, const std::string& where) {
    if (!node.is_object()) {
        throw ConfigError("'" + where + "' must be an object");
    }
    return node;
}

agenteval::eval::AgentSettings agent_from_json(const json& node, const std::string& where) {
    require_object(node, where);
    agenteval::eval::AgentSettings agent;
    agent.command = get_or<std::string>(node, "command", {}, where);
    agent.model = get_or<std::string>(node, "model", {}, where);
    agent.api_key = get_or<std::string>(node, "api_key", {}, where);
    return agent;
}

agenteval::eval::EmbeddingSettings embedding_from_json(const json& node) {
    require_object(node, "embedding");
    agenteval::eval::EmbeddingSettings embedding;
    embedding.command = get_or<std::string>(node, "command", {}, "embedding");
    embedding.model = get_or<std::string>(node, "model", embedding.model, "embedding");
    embedding.api_key = get_or<std::string>(node, "api_key", {}, "embedding");
    embedding.max_attempts = get_or<int>(node, "max_attempts", embedding.max_attempts, "embedding");
    embedding.retry_delay = std::chrono::milliseconds{
        get_or<long long>(node, "retry_delay_ms", embedding.retry_delay.count(), "embedding")};
    return embedding;
}

void apply_evaluation(const json& node, agenteval::eval::EvaluationSettings& out) {
    require_object(node, "evaluation");
    const std::string where = "evaluation";
    out.threshold = get_or<double>(node, "threshold", out.threshold, where);

    if (node.contains("scoring_method")) {
        const auto raw = get_or<std::string>(node, "scoring_method", {}, where);
        const auto method = agenteval::eval::scoring_method_from_string(raw);
        if (!method) {
            throw ConfigError("Unknown scoring method '" + raw + "'");
        }
        out.scoring_method = *method;
    }

    const auto concurrency = get_or<long long>(node, "max_concurrency",
                                               static_cast<long long>(out.max_concurrency), where);
    if (concurrency < 1) {
        throw ConfigError("'evaluation.max_concurrency' must be at least 1");
    }
    out.max_concurrency = static_cast<std::size_t>(concurrency);

    if (node.contains("output_format")) {
        const auto raw = get_or<std::string>(node, "output_format", {}, where);
        const auto format = agenteval::eval::output_format_from_string(raw);
        if (!format) {
            throw ConfigError("Unknown output format '" + raw + "'");
        }
        out.output_format = *format;
    }

    out.stop_on_error = get_or<bool>(node, "stop_on_error", out.stop_on_error, where);
    out.test_dir = get_or<std::string>(node, "test_dir", out.test_dir.string(), where);
    out.case_sensitive = get_or<bool>(node, "case_sensitive", out.case_sensitive, where);
}

}  // namespace

namespace agenteval::eval {

std::optional<ScoringMethod> scoring_method_from_string(std::string_view name) {
    if (name == "semantic-similarity") return ScoringMethod::SemanticSimilarity;
    if (name == "rouge") return ScoringMethod::Rouge;
    if (name == "exact-match") return ScoringMethod::ExactMatch;
    return std::nullopt;
}

std::string_view to_string(ScoringMethod method) {
    switch (method) {
        case ScoringMethod::SemanticSimilarity: return "semantic-similarity";
        case ScoringMethod::Rouge:              return "rouge";
        case ScoringMethod::ExactMatch:         return "exact-match";
    }
    return "semantic-similarity";
}

std::optional<OutputFormat> output_format_from_string(std::string_view name) {
    if (name == "json") return OutputFormat::Json;
    if (name == "markdown") return OutputFormat::Markdown;
    if (name == "text") return OutputFormat::Text;
    return std::nullopt;
}

std::string_view to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Json:     return "json";
        case OutputFormat::Markdown: return "markdown";
        case OutputFormat::Text:     return "text";
    }
    return "text";
}

const AgentSettings& Config::agent(const std::string& name) const {
    const auto& key = name.empty() ? default_agent : name;
    if (key.empty()) {
        throw ConfigError("No agent given and no 'default_agent' configured");
    }
    const auto it = agents.find(key);
    if (it == agents.end()) {
        throw ConfigError("Agent '" + key + "' is not configured");
    }
    return it->second;
}

void Config::validate() const {
    if (!(evaluation.threshold >= 0.0 && evaluation.threshold <= 1.0)) {
        throw ConfigError("Threshold must be between 0 and 1");
    }
    if (evaluation.max_concurrency < 1) {
        throw ConfigError("Max concurrency must be at least 1");
    }
    for (const auto& [name, agent] : agents) {
        if (agent.command.empty()) {
            throw ConfigError("Agent '" + name + "' has no command");
        }
    }
    if (!default_agent.empty() && agents.find(default_agent) == agents.end()) {
        throw ConfigError("Default agent '" + default_agent + "' is not configured");
    }
    if (embedding && embedding->max_attempts < 1) {
        throw ConfigError("'embedding.max_attempts' must be at least 1");
    }
    if (embedding && embedding->retry_delay.count() < 0) {
        throw ConfigError("'embedding.retry_delay_ms' must not be negative");
    }
}

std::optional<std::string> process_env(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string{value};
    }
    return std::nullopt;
}

std::string interpolate_env(std::string_view value, const EnvLookup& lookup) {
    std::string out;
    out.reserve(value.size());
    std::size_t pos = 0;
    while (pos < value.size()) {
        const auto open = value.find("${", pos);
        if (open == std::string_view::npos) {
            break;
        }
        const auto close = value.find('}', open + 2);
        if (close == std::string_view::npos) {
            break;
        }
        out.append(value.substr(pos, open - pos));
        const std::string name{value.substr(open + 2, close - open - 2)};
        std::optional<std::string> resolved;
        if (!name.empty()) {
            resolved = lookup(name);
        }
        if (resolved) {
            out += *resolved;
        } else {
            out.append(value.substr(open, close - open + 1));
        }
        pos = close + 1;
    }
    out.append(value.substr(pos));
    return out;
}

void interpolate_env_in(nlohmann::json& node, const EnvLookup& lookup) {
    if (node.is_string()) {
        node = interpolate_env(node.get_ref<const std::string&>(), lookup);
    } else if (node.is_object() || node.is_array()) {
        for (auto& child : node) {
            interpolate_env_in(child, lookup);
        }
    }
}

Config config_from_json(const nlohmann::json& document) {
    require_object(document, "config");
    Config config;

    if (const auto it = document.find("agents"); it != document.end()) {
        require_object(*it, "agents");
        for (const auto& [name, node] : it->items()) {
            config.agents.emplace(name, agent_from_json(node, "agents." + name));
        }
    }
    config.default_agent = get_or<std::string>(document, "default_agent", {}, "config");
    if (const auto it = document.find("embedding"); it != document.end() && !it->is_null()) {
        config.embedding = embedding_from_json(*it);
    }
    if (const auto it = document.find("evaluation"); it != document.end() && !it->is_null()) {
        apply_evaluation(*it, config.evaluation);
    }

    config.validate();
    return config;
}

Config load_config(const std::filesystem::path& path, const EnvLookup& lookup) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ConfigError("Unable to open configuration file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    json document;
    try {
        document = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigError("Failed to parse " + path.string() + ": " + e.what());
    }
    interpolate_env_in(document, lookup);
    try {
        return config_from_json(document);
    } catch (const ConfigError& e) {
        throw ConfigError("Invalid configuration in " + path.string() + ": " + e.what());
    }
}

}  // namespace agenteval::eval
