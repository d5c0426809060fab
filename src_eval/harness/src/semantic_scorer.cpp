#include "agenteval_eval/semantic_scorer.hpp"

#include "agenteval/cosine_similarity.hpp"

#include <stdexcept>

namespace agenteval::eval {

SemanticScorer::SemanticScorer(EmbeddingProvider& provider, RetryPolicy policy)
    : provider_(provider), policy_(policy) {}

double SemanticScorer::score_strings(const std::string& expected, const std::string& observed) {
    try {
        const auto a = with_retries(policy_, [&] { return provider_.generate_embedding(expected); });
        const auto b = with_retries(policy_, [&] { return provider_.generate_embedding(observed); });
        return cosine_similarity(a.embedding, b.embedding);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string{"Failed to calculate similarity score: "} + e.what());
    }
}

}  // namespace agenteval::eval
