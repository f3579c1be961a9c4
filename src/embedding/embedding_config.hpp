#pragma once

#include <optional>
#include <string>

namespace kbengine {

struct EmbeddingConfig {
    std::string model;
    int dimensions = 0;
    std::string api_key;
    std::string base_url;
};

// Per-request overrides; unset fields keep the deployment default.
struct EmbeddingOverrides {
    std::optional<std::string> model;
    std::optional<int> dimensions;
    std::optional<std::string> api_key;
    std::optional<std::string> base_url;
};

// Applies overrides onto defaults and validates the outcome. Throws ConfigurationError
// when the credential, model, dimensions or endpoint are missing or invalid.
EmbeddingConfig resolve_embedding_config(const EmbeddingConfig& defaults, const EmbeddingOverrides& overrides);

bool operator==(const EmbeddingConfig& lhs, const EmbeddingConfig& rhs);

}  // namespace kbengine
