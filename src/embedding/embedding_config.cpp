#include "embedding/embedding_config.hpp"

#include "core/errors.hpp"
#include "util/text.hpp"

namespace kbengine {

EmbeddingConfig resolve_embedding_config(const EmbeddingConfig& defaults, const EmbeddingOverrides& overrides) {
    EmbeddingConfig resolved = defaults;
    if (overrides.model) {
        resolved.model = *overrides.model;
    }
    if (overrides.dimensions) {
        resolved.dimensions = *overrides.dimensions;
    }
    if (overrides.api_key) {
        resolved.api_key = *overrides.api_key;
    }
    if (overrides.base_url) {
        resolved.base_url = *overrides.base_url;
    }
    resolved.base_url = text::strip_trailing_slashes(text::trim(resolved.base_url));

    if (resolved.api_key.empty()) {
        throw ConfigurationError("embedding provider API key is not configured: OPENAI_API_KEY");
    }
    if (resolved.model.empty()) {
        throw ConfigurationError("embedding model is not configured: EMBEDDING_MODEL");
    }
    if (resolved.dimensions <= 0) {
        throw ConfigurationError("embedding dimensions must be positive, got " +
                                 std::to_string(resolved.dimensions));
    }
    if (resolved.base_url.empty()) {
        throw ConfigurationError("embedding provider base URL is not configured: OPENAI_BASE_URL");
    }
    return resolved;
}

bool operator==(const EmbeddingConfig& lhs, const EmbeddingConfig& rhs) {
    return lhs.model == rhs.model && lhs.dimensions == rhs.dimensions && lhs.api_key == rhs.api_key &&
           lhs.base_url == rhs.base_url;
}

}  // namespace kbengine
