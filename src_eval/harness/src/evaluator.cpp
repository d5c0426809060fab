#include "agenteval_eval/evaluator.hpp"

#include "agenteval/rouge.hpp"
#include "agenteval/text_processing.hpp"

#include <algorithm>
#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {

std::string utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

std::string describe(const agenteval::eval::AgentError& error) {
    if (error.code.empty()) {
        return error.message;
    }
    return error.message + " (" + error.code + ")";
}

std::string format_score(double score) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3) << score;
    return os.str();
}

}  // namespace

namespace agenteval::eval {

Evaluator::Evaluator(Agent& agent, Options options, Logger& logger, SemanticScorer* semantic)
    : agent_(agent), options_(options), logger_(logger), semantic_(semantic) {
    if (options_.scoring_method == ScoringMethod::SemanticSimilarity && semantic_ == nullptr) {
        throw ConfigError("Semantic similarity scoring requires an embedding provider");
    }
    if (options_.max_concurrency == 0) {
        options_.max_concurrency = 1;
    }
}

double Evaluator::score_text(const std::string& expected, const std::string& observed) {
    switch (options_.scoring_method) {
        case ScoringMethod::ExactMatch: {
            auto a = text::trim_copy(expected);
            auto b = text::trim_copy(observed);
            if (!options_.case_sensitive) {
                a = text::to_lower_copy(a);
                b = text::to_lower_copy(b);
            }
            return a == b ? 1.0 : 0.0;
        }
        case ScoringMethod::Rouge: {
            const auto scores = compute_rouge(expected, observed);
            return std::max({scores.rouge1, scores.rouge2, scores.rougeL});
        }
        case ScoringMethod::SemanticSimilarity:
            return semantic_->score_strings(expected, observed);
    }
    return 0.0;
}

EvaluationResult Evaluator::run_case(const TestCase& test_case, int run) {
    EvaluationResult result;
    result.test_case_id = test_case.id;
    result.name = test_case.name;
    result.run = run;
    if (!test_case.message_blocks.empty()) {
        result.expected = test_case.message_blocks.back().content;
    }

    logger_.debug("evaluator", "Executing " + test_case.id + " (run " + std::to_string(run) + ")");
    const auto started = std::chrono::steady_clock::now();
    try {
        if (test_case.message_blocks.empty()) {
            throw std::runtime_error("Test case has no messages");
        }
        agent_.reset();
        const std::vector<MessageBlock> prompt(test_case.message_blocks.begin(),
                                               test_case.message_blocks.end() - 1);
        const auto output = agent_.send_input(to_agent_input(prompt));

        if (output.error) {
            result.error = describe(*output.error);
        } else {
            result.observed = output.response;
            if (test_case.has_fuzzy_match_assertions()) {
                result.fuzzy_matches =
                    fuzzy_.evaluate_assertions(test_case.fuzzy_match_assertions, result.observed);
                result.score = FuzzyMatchScoringService::calculate_overall_score(result.fuzzy_matches);
                result.passed = FuzzyMatchScoringService::all_assertions_passed(result.fuzzy_matches);
            } else {
                result.score = score_text(result.expected, result.observed);
                result.passed = result.score >= options_.threshold;
            }
        }
        agent_.reset();
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.error) {
        result.score = 0.0;
        result.passed = false;
        logger_.error("evaluator", test_case.id + " failed: " + *result.error);
    } else if (!result.passed) {
        logger_.warn("evaluator", test_case.id + " scored " + format_score(result.score));
    } else {
        logger_.debug("evaluator", test_case.id + " passed with " + format_score(result.score));
    }
    return result;
}

EvaluationReport Evaluator::run(const std::vector<TestCase>& test_cases) {
    struct Execution {
        const TestCase* test_case;
        int run;
    };
    std::vector<Execution> executions;
    for (const auto& test_case : test_cases) {
        const int runs = test_case.runs.value_or(1);
        for (int run = 1; run <= runs; ++run) {
            executions.push_back({&test_case, run});
        }
    }

    logger_.info("evaluator", "Running " + std::to_string(executions.size()) + " executions of " +
                                  std::to_string(test_cases.size()) + " test cases, concurrency " +
                                  std::to_string(options_.max_concurrency));

    EvaluationReport report;
    report.results.reserve(executions.size());
    for (std::size_t begin = 0; begin < executions.size(); begin += options_.max_concurrency) {
        const auto end = std::min(executions.size(), begin + options_.max_concurrency);
        std::vector<std::future<EvaluationResult>> chunk;
        chunk.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            const auto execution = executions[i];
            chunk.push_back(std::async(std::launch::async, [this, execution] {
                return run_case(*execution.test_case, execution.run);
            }));
        }
        for (auto& future : chunk) {
            report.results.push_back(future.get());
        }
    }

    report.summary = summarize(report.results, options_.threshold);
    report.metadata.timestamp = utc_timestamp();
    report.metadata.scoring_method = options_.scoring_method;
    report.metadata.threshold = options_.threshold;
    report.metadata.has_errors = std::any_of(report.results.begin(), report.results.end(),
                                             [](const EvaluationResult& r) { return r.error.has_value(); });

    logger_.info("evaluator", std::to_string(report.summary.passed) + "/" +
                                  std::to_string(report.summary.total) + " passed");
    return report;
}

EvaluationSummary Evaluator::summarize(const std::vector<EvaluationResult>& results, double threshold) {
    EvaluationSummary summary;
    summary.total = results.size();
    summary.threshold = threshold;
    double total_score = 0.0;
    for (const auto& result : results) {
        if (result.passed) {
            ++summary.passed;
        }
        total_score += result.score;
    }
    summary.failed = summary.total - summary.passed;
    if (summary.total > 0) {
        summary.pass_rate = static_cast<double>(summary.passed) / static_cast<double>(summary.total);
        summary.average_score = total_score / static_cast<double>(summary.total);
    }
    return summary;
}

}  // namespace agenteval::eval
