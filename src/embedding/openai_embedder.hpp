#pragma once

#include <string>
#include <vector>

#include "embedding/embedder.hpp"
#include "net/http_client.hpp"

namespace kbengine
{

    // Embedder for OpenAI-compatible `POST {base_url}/embeddings` endpoints.
    class OpenAiEmbedder : public Embedder
    {
    public:
        OpenAiEmbedder();
        explicit OpenAiEmbedder(HttpTransport transport);

        EmbeddingResult embed(const std::string &text,
                              const EmbeddingConfig &config,
                              const CallContext &context) const override;

        std::vector<EmbeddingResult> embed_batch(const std::vector<std::string> &texts,
                                                 const EmbeddingConfig &config,
                                                 const CallContext &context) const override;

    private:
        HttpTransport transport_;
    };

} // namespace kbengine
