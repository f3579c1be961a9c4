#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "embedding/embedding_config.hpp"
#include "net/cancellation.hpp"

namespace kbengine {

struct CallContext {
    std::chrono::milliseconds timeout{30000};
    const CancellationToken* cancellation = nullptr;
};

// Converts text to fixed-dimension vectors. Implementations never retry; the
// retrieval service owns the retry policy.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual EmbeddingResult embed(const std::string& text,
                                  const EmbeddingConfig& config,
                                  const CallContext& context) const = 0;

    // An empty input returns an empty result without contacting the provider.
    virtual std::vector<EmbeddingResult> embed_batch(const std::vector<std::string>& texts,
                                                     const EmbeddingConfig& config,
                                                     const CallContext& context) const = 0;
};

}  // namespace kbengine
