#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "chunk/text_chunker.hpp"
#include "core/types.hpp"
#include "embedding/embedder.hpp"

namespace kbengine {

struct DocumentSource {
    std::string document_id;
    std::string knowledge_base_id;
    std::string title;
    std::string content;
    std::string content_type = "text/plain";
};

struct IndexOptions {
    ChunkConfig chunk_config;
    EmbeddingConfig embedding_config;
    std::size_t batch_size = 20;
    CallContext call_context;
};

struct IndexedDocument {
    std::string document_id;
    std::vector<Chunk> chunks;
    int total_tokens = 0;
};

// Turns a document's text into embedded chunks ready to be persisted by the
// ingestion pipeline. Nothing is written here.
class DocumentIndexer {
public:
    explicit DocumentIndexer(const Embedder& embedder);

    // Throws InvalidOptionError when the text yields no chunks; embedding errors propagate.
    IndexedDocument index(const DocumentSource& source, const IndexOptions& options) const;

private:
    const Embedder& embedder_;
};

}  // namespace kbengine
