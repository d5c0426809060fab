// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include "agenteval/cosine_similarity.hpp"

#include <cmath>
#include <stdexcept>

namespace agenteval {

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.empty() || b.empty()) {
        throw std::invalid_argument("Vectors cannot be empty");
    }
    if (a.size() != b.size()) {
        throw std::invalid_argument("Vectors must have the same dimensions");
    }
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
        norm_a += a[i] * a[i];
        norm_b += b[i] * b[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0) {
        throw std::invalid_argument("Vectors cannot have zero magnitude");
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

}  // namespace agenteval
