#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace kbengine {

// Read access to persisted knowledge bases, documents and chunks. Owned by the
// caller and injected into the services that need it.
class KnowledgeRepository {
public:
    virtual ~KnowledgeRepository() = default;

    // Active, non-deleted bases of the tenant that have at least one COMPLETED document.
    virtual std::vector<KnowledgeBase> list_active_knowledge_bases(const std::string& tenant_id) = 0;

    // Non-deleted bases among ids, in no particular order. Unknown ids are omitted.
    virtual std::vector<KnowledgeBase> describe_knowledge_bases(const std::vector<std::string>& ids) = 0;

    // Chunks of COMPLETED, non-deleted documents of the base. Implementations may use
    // query_vector (nullptr when absent) for an approximate prefilter and may return a
    // superset of the best matches; limit caps the count when set.
    virtual std::vector<Chunk> get_candidate_chunks(const std::string& knowledge_base_id,
                                                    const std::vector<float>* query_vector,
                                                    std::optional<std::size_t> limit) = 0;

    virtual std::vector<Chunk> get_document_chunks(const std::string& document_id) = 0;

    virtual std::optional<Document> find_document(const std::string& document_id) = 0;
};

}  // namespace kbengine
