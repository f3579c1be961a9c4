#include "search/ranker.hpp"

#include <algorithm>

#include "core/errors.hpp"
#include "search/similarity.hpp"

namespace kbengine {
namespace {

double score(const std::vector<float>& query, const std::vector<float>& candidate, Metric metric) {
    switch (metric) {
        case Metric::Cosine:
            return cosine_similarity(query, candidate);
        case Metric::Euclidean:
            return 1.0 / (1.0 + euclidean_distance(query, candidate));
    }
    return 0.0;
}

}  // namespace

void validate(const RankOptions& options) {
    if (options.top_k < kMinTopK || options.top_k > kMaxTopK) {
        throw InvalidOptionError("top_k must be between 1 and 20, got " + std::to_string(options.top_k));
    }
    if (!(options.threshold >= 0.0 && options.threshold <= 1.0)) {
        throw InvalidOptionError("threshold must be between 0 and 1, got " + std::to_string(options.threshold));
    }
}

bool result_order(const SearchResult& lhs, const SearchResult& rhs) {
    if (lhs.score != rhs.score) {
        return lhs.score > rhs.score;
    }
    return lhs.position < rhs.position;
}

SearchResult to_search_result(const Chunk& chunk, double score) {
    SearchResult result;
    result.chunk_id = chunk.id;
    result.document_id = chunk.document_id;
    result.knowledge_base_id = chunk.knowledge_base_id;
    result.content = chunk.content;
    result.score = score;
    result.source = chunk.source_title;
    result.position = chunk.position;
    result.page = chunk.page;
    return result;
}

std::vector<SearchResult> rank(const std::vector<float>& query_vector,
                               const std::vector<Chunk>& candidates,
                               const RankOptions& options) {
    validate(options);

    std::vector<SearchResult> results;
    for (const auto& chunk : candidates) {
        if (chunk.embedding.empty()) {
            continue;
        }
        const double value = score(query_vector, chunk.embedding, options.metric);
        if (value >= options.threshold) {
            results.push_back(to_search_result(chunk, value));
        }
    }

    std::stable_sort(results.begin(), results.end(), result_order);
    if (results.size() > static_cast<std::size_t>(options.top_k)) {
        results.resize(static_cast<std::size_t>(options.top_k));
    }
    return results;
}

}  // namespace kbengine
