#include "ingest/document_indexer.hpp"

#include <algorithm>
#include <utility>

#include "core/errors.hpp"
#include "util/log.hpp"

namespace kbengine {
namespace {

bool is_markdown(const std::string& content_type) {
    return content_type == "text/markdown" || content_type == "text/x-markdown";
}

}  // namespace

DocumentIndexer::DocumentIndexer(const Embedder& embedder) : embedder_(embedder) {}

IndexedDocument DocumentIndexer::index(const DocumentSource& source, const IndexOptions& options) const {
    if (options.batch_size == 0) {
        throw InvalidOptionError("batch_size must be positive");
    }

    const auto text_chunks = is_markdown(source.content_type) ? chunk_markdown(source.content, options.chunk_config)
                                                              : chunk_text(source.content, options.chunk_config);
    if (text_chunks.empty()) {
        throw InvalidOptionError("no chunks generated from document " + source.document_id);
    }

    IndexedDocument indexed;
    indexed.document_id = source.document_id;
    indexed.chunks.reserve(text_chunks.size());

    for (std::size_t offset = 0; offset < text_chunks.size(); offset += options.batch_size) {
        throw_if_cancelled(options.call_context.cancellation);

        const std::size_t end = std::min(text_chunks.size(), offset + options.batch_size);
        std::vector<std::string> texts;
        texts.reserve(end - offset);
        for (std::size_t i = offset; i < end; ++i) {
            texts.push_back(text_chunks[i].content);
        }

        auto embeddings = embedder_.embed_batch(texts, options.embedding_config, options.call_context);
        for (std::size_t i = offset; i < end; ++i) {
            auto& embedding = embeddings[i - offset];
            const auto& text_chunk = text_chunks[i];

            Chunk chunk;
            chunk.id = source.document_id + ":" + std::to_string(text_chunk.position);
            chunk.document_id = source.document_id;
            chunk.knowledge_base_id = source.knowledge_base_id;
            chunk.position = text_chunk.position;
            chunk.content = text_chunk.content;
            chunk.token_count = embedding.token_count;
            chunk.embedding = std::move(embedding.embedding);
            chunk.embedding_model = embedding.model;
            if (!source.title.empty()) {
                chunk.source_title = source.title;
            }

            indexed.total_tokens += chunk.token_count;
            indexed.chunks.push_back(std::move(chunk));
        }
    }

    log::info("indexed document " + source.document_id + ": chunks=" + std::to_string(indexed.chunks.size()) +
              " tokens=" + std::to_string(indexed.total_tokens));
    return indexed;
}

}  // namespace kbengine
