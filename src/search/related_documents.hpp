#pragma once

#include <string>
#include <vector>

#include "store/knowledge_repository.hpp"

namespace kbengine {

struct RelatedOptions {
    int top_k = 5;
    double threshold = 0.7;
};

struct RelatedDocument {
    std::string document_id;
    std::string title;
    double score = 0.0;
};

// Other documents of the same knowledge base, scored by the mean cosine similarity
// over every pair of (source chunk, candidate chunk). Highest first.
// Unknown, deleted or not yet COMPLETED documents have no relations.
std::vector<RelatedDocument> find_related_documents(KnowledgeRepository& repository,
                                                    const std::string& document_id,
                                                    const RelatedOptions& options = {});

}  // namespace kbengine
