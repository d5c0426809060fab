#include "agenteval_eval/embedding_provider.hpp"

namespace agenteval::eval {

EmbeddingError::EmbeddingError(const std::string& message, int status)
    : std::runtime_error(message), status_(status) {}

}  // namespace agenteval::eval
