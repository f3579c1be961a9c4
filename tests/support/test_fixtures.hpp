#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

#include "core/types.hpp"
#include "embedding/embedder.hpp"

namespace kbengine::testing {

class MockEmbedder : public Embedder {
public:
    MOCK_METHOD(EmbeddingResult,
                embed,
                (const std::string& text, const EmbeddingConfig& config, const CallContext& context),
                (const, override));
    MOCK_METHOD(std::vector<EmbeddingResult>,
                embed_batch,
                (const std::vector<std::string>& texts, const EmbeddingConfig& config, const CallContext& context),
                (const, override));
};

// Unit vector in the plane whose cosine with (1, 0) is `score`.
inline std::vector<float> unit_with_cosine(double score) {
    return {static_cast<float>(score), static_cast<float>(std::sqrt(1.0 - score * score))};
}

inline EmbeddingConfig test_embedding_config(std::string model = "text-embedding-3-small", int dimensions = 2) {
    return EmbeddingConfig{
        .model = std::move(model),
        .dimensions = dimensions,
        .api_key = "sk-test",
        .base_url = "https://embeddings.example.test/v1",
    };
}

inline Chunk make_chunk(std::string id,
                        std::string document_id,
                        int position,
                        std::string content,
                        std::vector<float> embedding) {
    Chunk chunk;
    chunk.id = std::move(id);
    chunk.document_id = std::move(document_id);
    chunk.position = position;
    chunk.content = std::move(content);
    chunk.embedding = std::move(embedding);
    return chunk;
}

inline SearchResult make_result(std::string content, double score, std::optional<std::string> source = std::nullopt) {
    SearchResult result;
    result.content = std::move(content);
    result.score = score;
    result.source = std::move(source);
    return result;
}

}  // namespace kbengine::testing
