#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kbengine {

enum class DocumentStatus { Pending, Processing, Completed, Failed };

const char* to_string(DocumentStatus status);
// Throws InvalidOptionError for unknown values.
DocumentStatus parse_document_status(std::string_view value);

struct KnowledgeBase {
    std::string id;
    std::string tenant_id;
    std::optional<std::string> workspace_id;
    std::string name;
    bool is_active = true;
    // Empty means the deployment default model.
    std::string embedding_model;
    int completed_documents = 0;
};

struct Document {
    std::string id;
    std::string knowledge_base_id;
    std::string title;
    DocumentStatus status = DocumentStatus::Pending;
};

struct Chunk {
    std::string id;
    std::string document_id;
    std::string knowledge_base_id;
    int position = 0;
    std::string content;
    int token_count = 0;
    std::vector<float> embedding;
    std::string embedding_model;
    std::optional<std::string> source_title;
    std::optional<int> page;
};

struct SearchResult {
    std::string chunk_id;
    std::string document_id;
    std::string knowledge_base_id;
    std::string content;
    double score = 0.0;
    std::optional<std::string> source;
    int position = 0;
    std::optional<int> page;
};

struct EmbeddingResult {
    std::vector<float> embedding;
    int token_count = 0;
    std::string model;
};

}  // namespace kbengine
