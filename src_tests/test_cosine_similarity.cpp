/**
 * @file test_cosine_similarity.cpp
 * @brief Unit Tests for cosine similarity
 *
 * @author agenteval contributors
 * @date 2025
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "agenteval/cosine_similarity.hpp"

#include <stdexcept>
#include <vector>

using agenteval::cosine_similarity;
using Catch::Approx;

TEST_CASE("Cosine similarity values", "[cosine]") {
    const std::vector<double> v = {0.3, -1.2, 4.0};
    REQUIRE(cosine_similarity(v, v) == Approx(1.0));
    REQUIRE(cosine_similarity({1.0, 0.0}, {0.0, 1.0}) == Approx(0.0).margin(1e-12));
    REQUIRE(cosine_similarity({1.0, 2.0}, {-1.0, -2.0}) == Approx(-1.0));
    REQUIRE(cosine_similarity({1.0, 2.0}, {2.0, 4.0}) == Approx(1.0));
}

TEST_CASE("Cosine similarity contract violations", "[cosine]") {
    REQUIRE_THROWS_AS(cosine_similarity({}, {}), std::invalid_argument);
    REQUIRE_THROWS_AS(cosine_similarity({1.0, 2.0}, {1.0, 2.0, 3.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(cosine_similarity({0.0, 0.0}, {1.0, 2.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(cosine_similarity({1.0, 2.0}, {0.0, 0.0}), std::invalid_argument);
}
