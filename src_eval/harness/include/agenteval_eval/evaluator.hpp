#pragma once

#include "agent.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "semantic_scorer.hpp"

#include "agenteval/fuzzy_match_scoring.hpp"
#include "agenteval/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace agenteval::eval {

/// Outcome of one execution of one test case.
struct EvaluationResult {
    std::string test_case_id;
    std::string name;
    int run{1};
    bool passed{false};
    double score{0.0};
    std::chrono::milliseconds duration{0};
    std::string expected;
    std::string observed;
    std::optional<std::string> error;
    std::vector<FuzzyMatchResult> fuzzy_matches;
};

struct EvaluationSummary {
    std::size_t total{0};
    std::size_t passed{0};
    std::size_t failed{0};
    double pass_rate{0.0};
    double average_score{0.0};
    double threshold{0.0};
};

struct EvaluationMetadata {
    std::string timestamp;  ///< UTC, ISO 8601
    ScoringMethod scoring_method{ScoringMethod::SemanticSimilarity};
    double threshold{0.0};
    bool has_errors{false};
};

struct EvaluationReport {
    EvaluationSummary summary;
    std::vector<EvaluationResult> results;
    EvaluationMetadata metadata;
};

/**
 * \brief Replays test cases against an agent and scores the replies.
 *
 * For each execution the agent is reset, receives every block except the last, and its reply is
 * compared with the last block. Cases carrying fuzzy-match assertions are judged by those
 * assertions alone; all others by the configured scoring method against the threshold.
 *
 * Executions run in chunks of `max_concurrency`: every chunk is launched at once and awaited
 * before the next one starts. The agent must tolerate concurrent send_input() calls.
 */
class Evaluator {
public:
    struct Options {
        ScoringMethod scoring_method{ScoringMethod::SemanticSimilarity};
        double threshold{0.8};
        bool case_sensitive{false};
        std::size_t max_concurrency{5};
    };

    /// Throws ConfigError when semantic scoring is selected without a scorer.
    Evaluator(Agent& agent, Options options, Logger& logger, SemanticScorer* semantic = nullptr);

    [[nodiscard]] EvaluationResult run_case(const TestCase& test_case, int run = 1);

    [[nodiscard]] EvaluationReport run(const std::vector<TestCase>& test_cases);

    [[nodiscard]] static EvaluationSummary summarize(const std::vector<EvaluationResult>& results,
                                                     double threshold);

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    [[nodiscard]] double score_text(const std::string& expected, const std::string& observed);

    Agent& agent_;
    Options options_;
    Logger& logger_;
    SemanticScorer* semantic_;
    FuzzyMatchScoringService fuzzy_;
};

}  // namespace agenteval::eval
