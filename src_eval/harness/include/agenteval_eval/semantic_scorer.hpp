#pragma once

#include "embedding_provider.hpp"
#include "retry.hpp"

#include <string>

namespace agenteval::eval {

/**
 * \brief Cosine similarity between the embeddings of two strings.
 *
 * Embedding calls go through with_retries(). Any failure surfaces as std::runtime_error
 * prefixed with "Failed to calculate similarity score: ".
 */
class SemanticScorer {
public:
    explicit SemanticScorer(EmbeddingProvider& provider, RetryPolicy policy = {});

    [[nodiscard]] double score_strings(const std::string& expected, const std::string& observed);

private:
    EmbeddingProvider& provider_;
    RetryPolicy policy_;
};

}  // namespace agenteval::eval
