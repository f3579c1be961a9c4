#include "store/memory_repository.hpp"

#include <utility>

#include "core/errors.hpp"

namespace kbengine {

void MemoryKnowledgeRepository::add_knowledge_base(KnowledgeBase knowledge_base) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = knowledge_base.id;
    if (bases_.find(id) == bases_.end()) {
        base_order_.push_back(id);
    }
    bases_[id] = StoredBase{std::move(knowledge_base), false};
}

void MemoryKnowledgeRepository::remove_knowledge_base(const std::string& knowledge_base_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bases_.find(knowledge_base_id);
    if (it != bases_.end()) {
        it->second.deleted = true;
    }
}

void MemoryKnowledgeRepository::add_document(Document document) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = document.id;
    documents_[id] = std::move(document);
}

void MemoryKnowledgeRepository::set_document_status(const std::string& document_id, DocumentStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        throw InvalidOptionError("unknown document: " + document_id);
    }
    it->second.status = status;
}

void MemoryKnowledgeRepository::add_chunk(Chunk chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(chunk.document_id);
    if (it == documents_.end()) {
        throw InvalidOptionError("chunk references unknown document: " + chunk.document_id);
    }
    if (chunk.knowledge_base_id.empty()) {
        chunk.knowledge_base_id = it->second.knowledge_base_id;
    }
    if (!chunk.source_title) {
        chunk.source_title = it->second.title;
    }
    chunks_.push_back(std::move(chunk));
}

int MemoryKnowledgeRepository::completed_documents_locked(const std::string& knowledge_base_id) const {
    int count = 0;
    for (const auto& [id, document] : documents_) {
        if (document.knowledge_base_id == knowledge_base_id && document.status == DocumentStatus::Completed) {
            ++count;
        }
    }
    return count;
}

std::vector<KnowledgeBase> MemoryKnowledgeRepository::list_active_knowledge_bases(const std::string& tenant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KnowledgeBase> result;
    for (const auto& id : base_order_) {
        const auto& stored = bases_.at(id);
        if (stored.deleted || !stored.knowledge_base.is_active || stored.knowledge_base.tenant_id != tenant_id) {
            continue;
        }
        const int completed = completed_documents_locked(id);
        if (completed == 0) {
            continue;
        }
        KnowledgeBase knowledge_base = stored.knowledge_base;
        knowledge_base.completed_documents = completed;
        result.push_back(std::move(knowledge_base));
    }
    return result;
}

std::vector<KnowledgeBase> MemoryKnowledgeRepository::describe_knowledge_bases(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KnowledgeBase> result;
    for (const auto& id : ids) {
        auto it = bases_.find(id);
        if (it == bases_.end() || it->second.deleted) {
            continue;
        }
        KnowledgeBase knowledge_base = it->second.knowledge_base;
        knowledge_base.completed_documents = completed_documents_locked(id);
        result.push_back(std::move(knowledge_base));
    }
    return result;
}

std::vector<Chunk> MemoryKnowledgeRepository::get_candidate_chunks(const std::string& knowledge_base_id,
                                                                   const std::vector<float>* /*query_vector*/,
                                                                   std::optional<std::size_t> limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Chunk> result;
    auto base = bases_.find(knowledge_base_id);
    if (base == bases_.end() || base->second.deleted) {
        return result;
    }
    for (const auto& chunk : chunks_) {
        if (limit && result.size() >= *limit) {
            break;
        }
        const auto& document = documents_.at(chunk.document_id);
        if (document.knowledge_base_id != knowledge_base_id || document.status != DocumentStatus::Completed) {
            continue;
        }
        result.push_back(chunk);
    }
    return result;
}

std::vector<Chunk> MemoryKnowledgeRepository::get_document_chunks(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Chunk> result;
    for (const auto& chunk : chunks_) {
        if (chunk.document_id == document_id) {
            result.push_back(chunk);
        }
    }
    return result;
}

std::optional<Document> MemoryKnowledgeRepository::find_document(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace kbengine
