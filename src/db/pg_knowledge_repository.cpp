#include "db/pg_knowledge_repository.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "util/log.hpp"

namespace kbengine
{

    namespace
    {
        constexpr const char *kStatusCompleted = "COMPLETED";

        constexpr const char *kChunkColumns =
            "SELECT c.\"id\", c.\"documentId\", d.\"knowledgeBaseId\", c.\"position\", c.\"content\", "
            "COALESCE(c.\"tokenCount\", 0), COALESCE(c.\"embedding\"::text, ''), COALESCE(kb.\"embeddingModel\", ''), "
            "d.\"title\", c.\"metadata\"->>'page' "
            "FROM \"KnowledgeChunk\" c "
            "JOIN \"KnowledgeDocument\" d ON d.\"id\" = c.\"documentId\" "
            "JOIN \"KnowledgeBase\" kb ON kb.\"id\" = d.\"knowledgeBaseId\" ";

        std::vector<float> parse_embedding(const std::string &raw, const std::string &chunk_id)
        {
            if (raw.empty())
            {
                return {};
            }
            try
            {
                const auto json = nlohmann::json::parse(raw);
                if (!json.is_array())
                {
                    throw std::runtime_error("embedding is not an array");
                }
                return json.get<std::vector<float>>();
            }
            catch (const std::exception &ex)
            {
                // An unreadable vector cannot be ranked; the chunk is skipped like one without embedding.
                log::warn("chunk " + chunk_id + " has an unreadable embedding: " + ex.what());
                return {};
            }
        }

        Chunk read_chunk(const pqxx::row &row)
        {
            Chunk chunk;
            chunk.id = row[0].c_str();
            chunk.document_id = row[1].c_str();
            chunk.knowledge_base_id = row[2].c_str();
            chunk.position = row[3].as<int>(0);
            chunk.content = row[4].c_str();
            chunk.token_count = row[5].as<int>(0);
            chunk.embedding = parse_embedding(row[6].c_str(), chunk.id);
            chunk.embedding_model = row[7].c_str();
            if (!row[8].is_null())
            {
                chunk.source_title = row[8].c_str();
            }
            if (!row[9].is_null())
            {
                try
                {
                    chunk.page = std::stoi(row[9].c_str());
                }
                catch (const std::exception &)
                {
                    log::warn("chunk " + chunk.id + " has a non-numeric page");
                }
            }
            return chunk;
        }

        KnowledgeBase read_knowledge_base(const pqxx::row &row)
        {
            KnowledgeBase knowledge_base;
            knowledge_base.id = row[0].c_str();
            knowledge_base.tenant_id = row[1].c_str();
            if (!row[2].is_null())
            {
                knowledge_base.workspace_id = row[2].c_str();
            }
            knowledge_base.name = row[3].c_str();
            knowledge_base.is_active = row[4].as<bool>(false);
            knowledge_base.embedding_model = row[5].c_str();
            knowledge_base.completed_documents = row[6].as<int>(0);
            return knowledge_base;
        }

        constexpr const char *kKnowledgeBaseColumns =
            "SELECT kb.\"id\", kb.\"tenantId\", kb.\"workspaceId\", kb.\"name\", kb.\"isActive\", "
            "COALESCE(kb.\"embeddingModel\", ''), "
            "(SELECT COUNT(*) FROM \"KnowledgeDocument\" d "
            " WHERE d.\"knowledgeBaseId\" = kb.\"id\" AND d.\"status\" = $2 AND d.\"deletedAt\" IS NULL) "
            "FROM \"KnowledgeBase\" kb ";

    } // namespace

    PgKnowledgeRepository::PgKnowledgeRepository(const std::string &conninfo)
        : connection_{conninfo}
    {
        if (!connection_.is_open())
        {
            throw ConfigurationError("failed to open postgres connection");
        }
    }

    std::vector<KnowledgeBase> PgKnowledgeRepository::list_active_knowledge_bases(const std::string &tenant_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::read_transaction txn{connection_};
        const auto result = txn.exec_params(
            std::string{kKnowledgeBaseColumns} +
                "WHERE kb.\"tenantId\" = $1 AND kb.\"isActive\" = TRUE AND kb.\"deletedAt\" IS NULL "
                "AND EXISTS (SELECT 1 FROM \"KnowledgeDocument\" d "
                "            WHERE d.\"knowledgeBaseId\" = kb.\"id\" AND d.\"status\" = $2 "
                "            AND d.\"deletedAt\" IS NULL) "
                "ORDER BY kb.\"createdAt\" ASC, kb.\"id\" ASC;",
            tenant_id,
            kStatusCompleted);
        txn.commit();

        std::vector<KnowledgeBase> bases;
        bases.reserve(result.size());
        for (const auto &row : result)
        {
            bases.push_back(read_knowledge_base(row));
        }
        return bases;
    }

    std::vector<KnowledgeBase> PgKnowledgeRepository::describe_knowledge_bases(const std::vector<std::string> &ids)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::read_transaction txn{connection_};
        std::vector<KnowledgeBase> bases;
        for (const auto &id : ids)
        {
            const auto result = txn.exec_params(
                std::string{kKnowledgeBaseColumns} + "WHERE kb.\"id\" = $1 AND kb.\"deletedAt\" IS NULL;",
                id,
                kStatusCompleted);
            if (!result.empty())
            {
                bases.push_back(read_knowledge_base(result[0]));
            }
        }
        txn.commit();
        return bases;
    }

    std::vector<Chunk> PgKnowledgeRepository::get_candidate_chunks(const std::string &knowledge_base_id,
                                                                   const std::vector<float> * /*query_vector*/,
                                                                   std::optional<std::size_t> limit)
    {
        const std::string where =
            "WHERE d.\"knowledgeBaseId\" = $1 AND d.\"status\" = $2 AND d.\"deletedAt\" IS NULL "
            "AND kb.\"deletedAt\" IS NULL "
            "ORDER BY d.\"id\" ASC, c.\"position\" ASC";

        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::read_transaction txn{connection_};
        const auto result =
            limit ? txn.exec_params(std::string{kChunkColumns} + where + " LIMIT $3;",
                                    knowledge_base_id,
                                    kStatusCompleted,
                                    static_cast<long long>(*limit))
                  : txn.exec_params(std::string{kChunkColumns} + where + ";", knowledge_base_id, kStatusCompleted);
        txn.commit();

        std::vector<Chunk> chunks;
        chunks.reserve(result.size());
        for (const auto &row : result)
        {
            chunks.push_back(read_chunk(row));
        }
        return chunks;
    }

    std::vector<Chunk> PgKnowledgeRepository::get_document_chunks(const std::string &document_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::read_transaction txn{connection_};
        const auto result = txn.exec_params(
            std::string{kChunkColumns} + "WHERE c.\"documentId\" = $1 ORDER BY c.\"position\" ASC;", document_id);
        txn.commit();

        std::vector<Chunk> chunks;
        chunks.reserve(result.size());
        for (const auto &row : result)
        {
            chunks.push_back(read_chunk(row));
        }
        return chunks;
    }

    std::optional<Document> PgKnowledgeRepository::find_document(const std::string &document_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::read_transaction txn{connection_};
        const auto result = txn.exec_params(
            "SELECT \"id\", \"knowledgeBaseId\", \"title\", \"status\" "
            "FROM \"KnowledgeDocument\" "
            "WHERE \"id\" = $1 AND \"deletedAt\" IS NULL;",
            document_id);
        txn.commit();
        if (result.empty())
        {
            return std::nullopt;
        }
        Document document;
        document.id = result[0][0].c_str();
        document.knowledge_base_id = result[0][1].c_str();
        document.title = result[0][2].c_str();
        document.status = parse_document_status(result[0][3].c_str());
        return document;
    }

} // namespace kbengine
