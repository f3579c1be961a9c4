#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <pqxx/pqxx>

#include "store/knowledge_repository.hpp"

namespace kbengine
{

    // Read-only KnowledgeRepository over the dashboard's PostgreSQL schema
    // ("KnowledgeBase", "KnowledgeDocument", "KnowledgeChunk"). Embeddings are stored
    // as JSON arrays. Candidate retrieval is exact: every chunk of the base is returned.
    class PgKnowledgeRepository : public KnowledgeRepository
    {
    public:
        explicit PgKnowledgeRepository(const std::string &conninfo);

        std::vector<KnowledgeBase> list_active_knowledge_bases(const std::string &tenant_id) override;
        std::vector<KnowledgeBase> describe_knowledge_bases(const std::vector<std::string> &ids) override;
        std::vector<Chunk> get_candidate_chunks(const std::string &knowledge_base_id,
                                                const std::vector<float> *query_vector,
                                                std::optional<std::size_t> limit) override;
        std::vector<Chunk> get_document_chunks(const std::string &document_id) override;
        std::optional<Document> find_document(const std::string &document_id) override;

    private:
        std::mutex mutex_;
        pqxx::connection connection_;
    };

} // namespace kbengine
