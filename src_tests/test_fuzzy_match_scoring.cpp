/**
 * @file test_fuzzy_match_scoring.cpp
 * @brief Unit Tests for sliding-window fuzzy-match scoring
 *
 * @author agenteval contributors
 * @date 2025
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "agenteval/fuzzy_match_scoring.hpp"

#include <string>
#include <vector>

using agenteval::FuzzyMatchAssertion;
using agenteval::FuzzyMatchResult;
using agenteval::FuzzyMatchScoringService;
using Catch::Approx;

namespace {

FuzzyMatchAssertion assertion(const std::string& text, double threshold) {
    return FuzzyMatchAssertion{text, threshold, text};
}

}  // namespace

TEST_CASE("Single-token expectations", "[fuzzy_scoring]") {
    FuzzyMatchScoringService service;

    SECTION("Numeral matches its word") {
        const auto results =
            service.evaluate_assertions({assertion("4", 0.8)}, "two plus two equals four.");
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].passed);
        REQUIRE(results[0].final_score == Approx(1.0));
        REQUIRE(results[0].best_match == "four.");
        REQUIRE(results[0].match_position.start == 4);
        REQUIRE(results[0].match_position.end == 5);
        REQUIRE(results[0].rouge_scores.rouge2 == Approx(1.0));
    }

    SECTION("Word matches its numeral") {
        const auto result = service.evaluate_assertion(assertion("Four", 0.9), "I have 4 apples");
        REQUIRE(result.passed);
        REQUIRE(result.best_match == "4");
    }

    SECTION("Case and punctuation are ignored, first hit wins") {
        const auto result = service.evaluate_assertion(assertion("paris", 1.0), "(Paris) or PARIS!");
        REQUIRE(result.passed);
        REQUIRE(result.best_match == "(Paris)");
        REQUIRE(result.match_position.start == 0);
    }

    SECTION("Numbers outside the word table compare by value") {
        const auto result = service.evaluate_assertion(assertion("100", 1.0), "exactly +100 units");
        REQUIRE(result.passed);
        REQUIRE(result.best_match == "+100");
    }
}

TEST_CASE("Sliding-window search", "[fuzzy_scoring]") {
    FuzzyMatchScoringService service;

    SECTION("Phrase embedded in a longer reply") {
        const auto result = service.evaluate_assertion(
            assertion("temperature of 59°F", 0.95),
            "Tomorrow will be mild with a temperature of 59°F, 80% precipitation chance.");
        REQUIRE(result.passed);
        REQUIRE(result.final_score >= 0.95);
        REQUIRE(result.final_score <= 1.0);
        REQUIRE(result.best_match == "temperature of 59°F,");
        REQUIRE(result.match_position.end - result.match_position.start == 3);
    }

    SECTION("Partial match falls below a strict threshold") {
        const auto result =
            service.evaluate_assertion(assertion("sunny and warm", 0.9), "it will be sunny but cold");
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.final_score == Approx(1.0 / 3.0));
        REQUIRE(result.best_match == "sunny");
    }

    SECTION("No overlap at all") {
        const auto result = service.evaluate_assertion(assertion("banana bread", 0.5), "the sky is blue");
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.final_score == 0.0);
        REQUIRE(result.best_match.empty());
        REQUIRE(result.match_position.start == 0);
        REQUIRE(result.match_position.end == 0);
    }

    SECTION("Empty reply") {
        const auto result = service.evaluate_assertion(assertion("anything", 0.1), "");
        REQUIRE_FALSE(result.passed);
        REQUIRE(result.final_score == 0.0);
    }

    SECTION("Window length never exceeds the cap") {
        std::string reply;
        for (int i = 0; i < 40; ++i) {
            reply += "word" + std::to_string(i) + " ";
        }
        const auto result = service.evaluate_assertion(
            assertion("word3 word4 word5 word6 word7 word8 word9 word10 word11 word12 word13 word14", 0.5),
            reply);
        REQUIRE(result.match_position.end - result.match_position.start <=
                FuzzyMatchScoringService::kMaxWindowSize);
        REQUIRE(result.final_score == Approx(10.0 / 12.0));
        REQUIRE(result.passed);
    }
}

TEST_CASE("Aggregation", "[fuzzy_scoring]") {
    SECTION("Empty lists are vacuously satisfied") {
        REQUIRE(FuzzyMatchScoringService::calculate_overall_score({}) == 1.0);
        REQUIRE(FuzzyMatchScoringService::all_assertions_passed({}));
    }

    SECTION("Mean score and strict AND") {
        FuzzyMatchResult good;
        good.passed = true;
        good.final_score = 1.0;
        FuzzyMatchResult bad;
        bad.passed = false;
        bad.final_score = 0.5;

        const std::vector<FuzzyMatchResult> results = {good, bad};
        REQUIRE(FuzzyMatchScoringService::calculate_overall_score(results) == Approx(0.75));
        REQUIRE_FALSE(FuzzyMatchScoringService::all_assertions_passed(results));
        REQUIRE(FuzzyMatchScoringService::all_assertions_passed({good, good}));
    }
}
