#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace agenteval::eval {

/**
 * \brief Failure reported by an embedding provider.
 *
 * `status` follows HTTP conventions (0 when unknown). Statuses of 500 and above, gateway
 * timeouts included, are transient and eligible for retry.
 */
class EmbeddingError : public std::runtime_error {
public:
    explicit EmbeddingError(const std::string& message, int status = 0);

    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] bool transient() const noexcept { return status_ >= 500; }

private:
    int status_;
};

struct EmbeddingResponse {
    std::vector<double> embedding;
};

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /// Throws EmbeddingError on failure, std::invalid_argument for empty text.
    [[nodiscard]] virtual EmbeddingResponse generate_embedding(const std::string& text) = 0;
};

}  // namespace agenteval::eval
