#pragma once

#include "embedding_provider.hpp"

#include <chrono>
#include <thread>

namespace agenteval::eval {

struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds delay{1000};
};

/**
 * \brief Runs `fn`, retrying transient EmbeddingError failures with a fixed delay.
 *
 * Non-transient errors and any other exception propagate immediately. After the last attempt the
 * final EmbeddingError is rethrown.
 */
template <typename Fn>
auto with_retries(const RetryPolicy& policy, Fn&& fn) -> decltype(fn()) {
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const EmbeddingError& e) {
            if (!e.transient() || attempt >= attempts) {
                throw;
            }
        }
        if (policy.delay.count() > 0) {
            std::this_thread::sleep_for(policy.delay);
        }
    }
}

}  // namespace agenteval::eval
