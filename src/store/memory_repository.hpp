#pragma once

#include <mutex>
#include <unordered_map>

#include "store/knowledge_repository.hpp"

namespace kbengine {

// In-process repository. Each instance is independent; nothing is shared between
// instances. All methods are safe to call concurrently.
class MemoryKnowledgeRepository : public KnowledgeRepository {
public:
    void add_knowledge_base(KnowledgeBase knowledge_base);
    // Soft delete: the base stays stored but is no longer returned.
    void remove_knowledge_base(const std::string& knowledge_base_id);
    void add_document(Document document);
    void set_document_status(const std::string& document_id, DocumentStatus status);
    // The chunk's document must have been added first.
    void add_chunk(Chunk chunk);

    std::vector<KnowledgeBase> list_active_knowledge_bases(const std::string& tenant_id) override;
    std::vector<KnowledgeBase> describe_knowledge_bases(const std::vector<std::string>& ids) override;
    std::vector<Chunk> get_candidate_chunks(const std::string& knowledge_base_id,
                                            const std::vector<float>* query_vector,
                                            std::optional<std::size_t> limit) override;
    std::vector<Chunk> get_document_chunks(const std::string& document_id) override;
    std::optional<Document> find_document(const std::string& document_id) override;

private:
    struct StoredBase {
        KnowledgeBase knowledge_base;
        bool deleted = false;
    };

    int completed_documents_locked(const std::string& knowledge_base_id) const;

    mutable std::mutex mutex_;
    std::vector<std::string> base_order_;
    std::unordered_map<std::string, StoredBase> bases_;
    std::unordered_map<std::string, Document> documents_;
    std::vector<Chunk> chunks_;
};

}  // namespace kbengine
