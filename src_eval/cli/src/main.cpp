#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "agenteval_eval/command_agent.hpp"
#include "agenteval_eval/command_embedding_provider.hpp"
#include "agenteval_eval/config.hpp"
#include "agenteval_eval/evaluator.hpp"
#include "agenteval_eval/logger.hpp"
#include "agenteval_eval/report_writer.hpp"
#include "agenteval_eval/semantic_scorer.hpp"
#include "agenteval_eval/test_case_loader.hpp"

using agenteval::eval::CommandAgent;
using agenteval::eval::CommandEmbeddingProvider;
using agenteval::eval::Config;
using agenteval::eval::ConfigError;
using agenteval::eval::Evaluator;
using agenteval::eval::Logger;
using agenteval::eval::LogLevel;
using agenteval::eval::OutputFormat;
using agenteval::eval::ReportWriter;
using agenteval::eval::ScoringMethod;
using agenteval::eval::SemanticScorer;
using agenteval::eval::TestCaseLoader;

namespace {

constexpr const char* kDefaultConfigFile = "agenteval.config.json";

// Thrown for malformed command lines; mapped to the configuration exit code.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Args {
    std::string command;
    std::string agent;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> directory;
    std::optional<double> threshold;
    std::optional<OutputFormat> format;
    std::optional<std::size_t> max_concurrency;
    std::optional<std::filesystem::path> output;
    bool stop_on_error{false};
    bool verbose{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Conversational agent evaluation CLI\n"
        << "Usage:\n"
        << "  " << argv0 << " version\n"
        << "  " << argv0 << " run [agent] [-c <config>] [-d <dir>] [-t <threshold>] [-f <format>]\n"
        << "                 [-m <max-concurrency>] [-o <output>] [-s] [-v]\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config           Configuration file (default: ./" << kDefaultConfigFile << " if present).\n"
        << "  -d, --directory        Directory holding test-case files (default: examples).\n"
        << "  -t, --threshold        Pass threshold between 0 and 1 (default: 0.8).\n"
        << "  -f, --format           Report format: json, markdown or text (default: text).\n"
        << "  -m, --max-concurrency  Test cases evaluated at once (default: 5).\n"
        << "  -o, --output           Write the report to this file instead of stdout.\n"
        << "  -s, --stop-on-error    Stop at the first test-case file that fails to load.\n"
        << "  -v, --verbose          Debug logging.\n"
        << "  -h, --help             Show this help message.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::string expect_value(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        throw UsageError(std::string{flag} + " expects a value");
    }
    return argv[++i];
}

double parse_threshold(const std::string& raw) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(raw, &used);
    } catch (const std::exception&) {
        throw UsageError("Threshold must be a number: " + raw);
    }
    if (used != raw.size() || value < 0.0 || value > 1.0) {
        throw UsageError("Threshold must be between 0 and 1");
    }
    return value;
}

std::size_t parse_concurrency(const std::string& raw) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &used);
    } catch (const std::exception&) {
        throw UsageError("Max concurrency must be an integer: " + raw);
    }
    if (used != raw.size() || value < 1) {
        throw UsageError("Max concurrency must be at least 1");
    }
    return static_cast<std::size_t>(value);
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "-c") || arg_eq(tok, "--config")) {
            args.config_path = expect_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "-d") || arg_eq(tok, "--directory")) {
            args.directory = expect_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "-t") || arg_eq(tok, "--threshold")) {
            args.threshold = parse_threshold(expect_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "-f") || arg_eq(tok, "--format")) {
            const auto raw = expect_value(argc, argv, i, tok);
            args.format = agenteval::eval::output_format_from_string(raw);
            if (!args.format) {
                throw UsageError("Unknown output format '" + raw + "'");
            }
        } else if (arg_eq(tok, "-m") || arg_eq(tok, "--max-concurrency")) {
            args.max_concurrency = parse_concurrency(expect_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "-o") || arg_eq(tok, "--output")) {
            args.output = expect_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "-s") || arg_eq(tok, "--stop-on-error")) {
            args.stop_on_error = true;
        } else if (arg_eq(tok, "-v") || arg_eq(tok, "--verbose")) {
            args.verbose = true;
        } else if (!tok.empty() && tok.front() == '-') {
            throw UsageError("Unknown option '" + std::string{tok} + "'");
        } else if (args.command.empty()) {
            args.command = std::string{tok};
        } else if (args.agent.empty()) {
            args.agent = std::string{tok};
        } else {
            throw UsageError("Unexpected argument '" + std::string{tok} + "'");
        }
    }

    if (!args.help && args.command != "run" && args.command != "version") {
        throw UsageError(args.command.empty() ? "No command given"
                                              : "Unknown command '" + args.command + "'");
    }
    return args;
}

Config resolve_config(const Args& args) {
    Config config;
    if (args.config_path) {
        config = agenteval::eval::load_config(*args.config_path);
    } else if (std::filesystem::exists(kDefaultConfigFile)) {
        config = agenteval::eval::load_config(kDefaultConfigFile);
    }

    if (args.directory) config.evaluation.test_dir = *args.directory;
    if (args.threshold) config.evaluation.threshold = *args.threshold;
    if (args.format) config.evaluation.output_format = *args.format;
    if (args.max_concurrency) config.evaluation.max_concurrency = *args.max_concurrency;
    if (args.stop_on_error) config.evaluation.stop_on_error = true;

    config.validate();
    return config;
}

int run(const Args& args, Logger& logger) {
    const auto config = resolve_config(args);
    const auto& settings = config.agent(args.agent);
    const std::string agent_name = args.agent.empty() ? config.default_agent : args.agent;
    const auto& evaluation = config.evaluation;

    std::unique_ptr<CommandEmbeddingProvider> embeddings;
    std::unique_ptr<SemanticScorer> scorer;
    if (evaluation.scoring_method == ScoringMethod::SemanticSimilarity) {
        if (!config.embedding || config.embedding->command.empty()) {
            throw ConfigError("Semantic similarity scoring requires an 'embedding.command'");
        }
        embeddings = std::make_unique<CommandEmbeddingProvider>(CommandEmbeddingProvider::Settings{
            .command = config.embedding->command,
            .model = config.embedding->model,
            .api_key = config.embedding->api_key,
        });
        scorer = std::make_unique<SemanticScorer>(
            *embeddings, agenteval::eval::RetryPolicy{.max_attempts = config.embedding->max_attempts,
                                                      .delay = config.embedding->retry_delay});
    }

    CommandAgent agent(settings.command);
    try {
        agent.initialize({.model = settings.model.empty() ? agent_name : settings.model});
        agent.authenticate({.api_key = settings.api_key});
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Agent '" + agent_name + "': " + e.what());
    }
    logger.info("cli", "Evaluating agent '" + agent_name + "' with " +
                           std::string{agenteval::eval::to_string(evaluation.scoring_method)} +
                           " scoring");

    TestCaseLoader loader(evaluation.test_dir);
    const auto loaded = loader.load_directory(evaluation.test_dir, evaluation.stop_on_error);
    for (const auto& warning : loaded.warnings) {
        logger.warn("loader", warning.file_path + ": " + warning.message);
    }
    for (const auto& error : loaded.errors) {
        logger.error("loader", error.file_path + ": " + error.message);
    }
    if (loaded.has_errors() && evaluation.stop_on_error) {
        agent.cleanup();
        return 1;
    }
    if (loaded.test_cases.empty()) {
        logger.error("loader", "No test cases found in " + evaluation.test_dir.string());
        agent.cleanup();
        return 1;
    }
    logger.info("loader", "Loaded " + std::to_string(loaded.test_cases.size()) + " test cases");

    Evaluator evaluator(agent,
                        Evaluator::Options{
                            .scoring_method = evaluation.scoring_method,
                            .threshold = evaluation.threshold,
                            .case_sensitive = evaluation.case_sensitive,
                            .max_concurrency = evaluation.max_concurrency,
                        },
                        logger, scorer.get());
    const auto report = evaluator.run(loaded.test_cases);
    agent.cleanup();

    ReportWriter writer;
    if (args.output) {
        writer.write(*args.output, report, evaluation.output_format);
        logger.info("cli", "Report written to " + args.output->string());
    } else {
        std::cout << writer.render(report, evaluation.output_format) << std::endl;
    }

    const bool all_passed = report.summary.failed == 0 && !loaded.has_errors();
    return all_passed ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    Logger logger(std::cerr, LogLevel::Info);
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (args.command == "version") {
            std::cout << "agenteval " << AGENTEVAL_VERSION << "\n";
            return 0;
        }
        if (args.verbose) {
            logger.set_level(LogLevel::Debug);
        }
        return run(args, logger);
    } catch (const UsageError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;
    } catch (const ConfigError& ex) {
        logger.error("config", ex.what());
        return 2;
    } catch (const std::exception& ex) {
        logger.error("cli", ex.what());
        return 3;
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3;
    }
}
