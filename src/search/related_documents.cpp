#include "search/related_documents.hpp"

#include <algorithm>
#include <map>

#include "search/ranker.hpp"
#include "search/similarity.hpp"

namespace kbengine {
namespace {

struct ScoreAccumulator {
    std::string title;
    double sum = 0.0;
    int count = 0;
};

}  // namespace

std::vector<RelatedDocument> find_related_documents(KnowledgeRepository& repository,
                                                    const std::string& document_id,
                                                    const RelatedOptions& options) {
    validate(RankOptions{options.top_k, options.threshold, Metric::Cosine});

    // Only a searchable document has relations.
    const auto document = repository.find_document(document_id);
    if (!document || document->status != DocumentStatus::Completed) {
        return {};
    }
    const auto source_chunks = repository.get_document_chunks(document_id);
    if (source_chunks.empty()) {
        return {};
    }
    const auto candidates = repository.get_candidate_chunks(document->knowledge_base_id, nullptr, std::nullopt);

    std::map<std::string, ScoreAccumulator> scores;
    for (const auto& source : source_chunks) {
        if (source.embedding.empty()) {
            continue;
        }
        for (const auto& other : candidates) {
            if (other.document_id == document_id || other.embedding.empty()) {
                continue;
            }
            auto& accumulator = scores[other.document_id];
            if (accumulator.count == 0) {
                accumulator.title = other.source_title.value_or("");
            }
            accumulator.sum += cosine_similarity(source.embedding, other.embedding);
            ++accumulator.count;
        }
    }

    std::vector<RelatedDocument> related;
    for (const auto& [id, accumulator] : scores) {
        const double mean = accumulator.sum / accumulator.count;
        if (mean >= options.threshold) {
            related.push_back(RelatedDocument{id, accumulator.title, mean});
        }
    }

    // Ties keep ascending document id order.
    std::stable_sort(related.begin(), related.end(),
                     [](const RelatedDocument& lhs, const RelatedDocument& rhs) { return lhs.score > rhs.score; });
    if (related.size() > static_cast<std::size_t>(options.top_k)) {
        related.resize(static_cast<std::size_t>(options.top_k));
    }
    return related;
}

}  // namespace kbengine
