// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#pragma once

#include <vector>

namespace agenteval {

/**
 * \brief dot(a,b) / (|a| * |b|).
 *
 * Throws std::invalid_argument when either vector is empty, the dimensions differ, or either
 * vector has zero magnitude.
 */
[[nodiscard]] double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);

}  // namespace agenteval
