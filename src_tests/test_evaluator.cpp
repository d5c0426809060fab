/**
 * @file test_evaluator.cpp
 * @brief Unit Tests for test-case orchestration against in-process fake agents
 *
 * @author agenteval contributors
 * @date 2025
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "agenteval/parser.hpp"
#include "agenteval_eval/evaluator.hpp"

#include <cmath>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using agenteval::eval::AgentAuth;
using agenteval::eval::AgentConfig;
using agenteval::eval::AgentInput;
using agenteval::eval::AgentOutput;
using agenteval::eval::ConfigError;
using agenteval::eval::EmbeddingResponse;
using agenteval::eval::Evaluator;
using agenteval::eval::Logger;
using agenteval::eval::LogLevel;
using agenteval::eval::ScoringMethod;
using agenteval::eval::SemanticScorer;
using Catch::Approx;

namespace {

class FakeAgent : public agenteval::eval::Agent {
public:
    using Responder = std::function<AgentOutput(const AgentInput&)>;

    explicit FakeAgent(Responder responder) : responder_(std::move(responder)) {}

    void initialize(const AgentConfig&) override {}
    void authenticate(const AgentAuth&) override {}

    AgentOutput send_input(const AgentInput& input) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inputs_.push_back(input);
        }
        return responder_(input);
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++resets_;
    }

    void cleanup() override {}

    std::vector<AgentInput> inputs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inputs_;
    }

    int resets() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return resets_;
    }

private:
    Responder responder_;
    mutable std::mutex mutex_;
    std::vector<AgentInput> inputs_;
    int resets_{0};
};

class FakeEmbeddings : public agenteval::eval::EmbeddingProvider {
public:
    EmbeddingResponse generate_embedding(const std::string& text) override {
        const auto it = vectors.find(text);
        if (it == vectors.end()) {
            throw agenteval::eval::EmbeddingError("unknown text", 400);
        }
        return {it->second};
    }

    std::map<std::string, std::vector<double>> vectors;
};

AgentOutput reply(const std::string& text) {
    return AgentOutput{text, std::nullopt};
}

agenteval::TestCase make_case(const std::string& text, const std::string& name = "case") {
    return agenteval::Parser{}.parse(text, name, name);
}

Evaluator::Options options(ScoringMethod method, double threshold = 0.8) {
    Evaluator::Options out;
    out.scoring_method = method;
    out.threshold = threshold;
    return out;
}

}  // namespace

TEST_CASE("Prompt construction and isolation", "[evaluator]") {
    std::ostringstream log;
    Logger logger(log, LogLevel::Debug);
    FakeAgent agent([](const AgentInput&) { return reply("hello"); });
    Evaluator evaluator(agent, options(ScoringMethod::ExactMatch), logger);

    const auto result = evaluator.run_case(
        make_case("system: be nice\nuser: hi\nhuman agent: hey\nuser: again\nassistant: hello"));

    const auto inputs = agent.inputs();
    REQUIRE(inputs.size() == 1);
    const auto& messages = inputs[0].messages;
    REQUIRE(messages.size() == 4);
    REQUIRE(messages[0].role == "system");
    REQUIRE(messages[1].role == "user");
    REQUIRE(messages[2].role == "assistant");
    REQUIRE(messages[2].content == "hey");
    REQUIRE(messages[3].content == "again");

    REQUIRE(agent.resets() == 2);
    REQUIRE(result.passed);
    REQUIRE(result.expected == "hello");
    REQUIRE(result.observed == "hello");
    REQUIRE(result.duration.count() >= 0);
    REQUIRE(log.str().find("[DEBUG] [evaluator]") != std::string::npos);
}

TEST_CASE("Scoring methods", "[evaluator]") {
    std::ostringstream log;
    Logger logger(log, LogLevel::Error);

    SECTION("Exact match ignores case and surrounding space by default") {
        FakeAgent agent([](const AgentInput&) { return reply("  Hello There \n"); });
        Evaluator evaluator(agent, options(ScoringMethod::ExactMatch), logger);
        REQUIRE(evaluator.run_case(make_case("user: hi\nassistant: hello there")).passed);
    }

    SECTION("Exact match can be case-sensitive") {
        FakeAgent agent([](const AgentInput&) { return reply("Hello There"); });
        auto opts = options(ScoringMethod::ExactMatch);
        opts.case_sensitive = true;
        Evaluator evaluator(agent, opts, logger);
        const auto result = evaluator.run_case(make_case("user: hi\nassistant: hello there"));
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.score == 0.0);
    }

    SECTION("ROUGE takes the best of the three scores") {
        FakeAgent agent([](const AgentInput&) { return reply("the cat"); });
        Evaluator evaluator(agent, options(ScoringMethod::Rouge, 0.3), logger);
        const auto result = evaluator.run_case(make_case("user: q\nassistant: the cat sat on the mat"));
        REQUIRE(result.score == Approx(2.0 / 6.0));
        REQUIRE(result.passed);
    }

    SECTION("Semantic similarity uses the embedding scorer") {
        FakeEmbeddings embeddings;
        embeddings.vectors = {{"sunny", {1.0, 0.0}}, {"bright", {1.0, 1.0}}};
        SemanticScorer scorer(embeddings, {.max_attempts = 1, .delay = std::chrono::milliseconds{0}});
        FakeAgent agent([](const AgentInput&) { return reply("bright"); });
        Evaluator evaluator(agent, options(ScoringMethod::SemanticSimilarity, 0.7), logger, &scorer);
        const auto result = evaluator.run_case(make_case("user: q\nassistant: sunny"));
        REQUIRE(result.score == Approx(1.0 / std::sqrt(2.0)));
        REQUIRE(result.passed);
    }

    SECTION("Semantic failures become the case error") {
        FakeEmbeddings embeddings;
        SemanticScorer scorer(embeddings, {.max_attempts = 1, .delay = std::chrono::milliseconds{0}});
        FakeAgent agent([](const AgentInput&) { return reply("anything"); });
        Evaluator evaluator(agent, options(ScoringMethod::SemanticSimilarity), logger, &scorer);
        const auto result = evaluator.run_case(make_case("user: q\nassistant: expected"));
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.error.has_value());
        REQUIRE(result.error->find("Failed to calculate similarity score") != std::string::npos);
    }

    SECTION("Semantic scoring without a scorer is a configuration error") {
        FakeAgent agent([](const AgentInput&) { return reply(""); });
        REQUIRE_THROWS_AS(Evaluator(agent, options(ScoringMethod::SemanticSimilarity), logger),
                          ConfigError);
    }

    SECTION("Fuzzy assertions take precedence over the scoring method") {
        FakeAgent agent([](const AgentInput&) { return reply("two plus two equals four."); });
        Evaluator evaluator(agent, options(ScoringMethod::ExactMatch), logger);
        const auto result = evaluator.run_case(make_case("user: 2+2?\nassistant: It is [4|0.8]"));
        REQUIRE(result.passed);
        REQUIRE(result.score == Approx(1.0));
        REQUIRE(result.fuzzy_matches.size() == 1);
        REQUIRE(result.fuzzy_matches[0].best_match == "four.");
        REQUIRE(result.expected == "It is 4");
    }
}

TEST_CASE("Agent failures", "[evaluator]") {
    std::ostringstream log;
    Logger logger(log, LogLevel::Warn);

    SECTION("Reported errors score zero") {
        FakeAgent agent([](const AgentInput&) {
            return AgentOutput{"", agenteval::eval::AgentError{"rate limited", "429"}};
        });
        Evaluator evaluator(agent, options(ScoringMethod::ExactMatch), logger);
        const auto result = evaluator.run_case(make_case("user: q\nassistant: a"));
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.score == 0.0);
        REQUIRE(result.error == "rate limited (429)");
        REQUIRE(log.str().find("[ERROR] [evaluator] case failed: rate limited (429)") != std::string::npos);
    }

    SECTION("Thrown exceptions are captured per case") {
        FakeAgent agent([](const AgentInput&) -> AgentOutput { throw std::runtime_error("socket closed"); });
        Evaluator evaluator(agent, options(ScoringMethod::ExactMatch), logger);
        const auto result = evaluator.run_case(make_case("user: q\nassistant: a"));
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.error == "socket closed");
    }
}

TEST_CASE("Batch execution", "[evaluator]") {
    std::ostringstream log;
    Logger logger(log, LogLevel::Error);
    FakeAgent agent([](const AgentInput& input) { return reply(input.messages.back().content); });
    auto opts = options(ScoringMethod::ExactMatch);
    opts.max_concurrency = 2;
    Evaluator evaluator(agent, opts, logger);

    auto repeated = make_case("user: echo\nassistant: echo", "repeated");
    repeated.runs = 3;
    const std::vector<agenteval::TestCase> cases = {
        make_case("user: one\nassistant: one", "first"),
        repeated,
        make_case("user: two\nassistant: three", "last"),
    };

    const auto report = evaluator.run(cases);

    REQUIRE(report.results.size() == 5);
    REQUIRE(report.results[0].name == "first");
    REQUIRE(report.results[1].run == 1);
    REQUIRE(report.results[2].run == 2);
    REQUIRE(report.results[3].run == 3);
    REQUIRE(report.results[3].name == "repeated");
    REQUIRE(report.results[4].name == "last");
    REQUIRE_FALSE(report.results[4].passed);

    REQUIRE(report.summary.total == 5);
    REQUIRE(report.summary.passed == 4);
    REQUIRE(report.summary.failed == 1);
    REQUIRE(report.summary.pass_rate == Approx(0.8));
    REQUIRE(report.summary.average_score == Approx(0.8));
    REQUIRE(report.summary.threshold == Approx(0.8));
    REQUIRE(report.metadata.scoring_method == ScoringMethod::ExactMatch);
    REQUIRE_FALSE(report.metadata.has_errors);
    REQUIRE(report.metadata.timestamp.size() == 20);
    REQUIRE(agent.inputs().size() == 5);
}

TEST_CASE("Summary of an empty run", "[evaluator]") {
    const auto summary = Evaluator::summarize({}, 0.5);
    REQUIRE(summary.total == 0);
    REQUIRE(summary.pass_rate == 0.0);
    REQUIRE(summary.average_score == 0.0);
    REQUIRE(summary.threshold == 0.5);
}
